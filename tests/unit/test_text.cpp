#include <gtest/gtest.h>
#include "../../src/pipeline/html_content_processor.hpp"
#include "../../src/pipeline/text_chunker.hpp"
#include "../../src/utils/text/converter.hpp"
#include "../../src/utils/text/string_utils.hpp"

using namespace Umbra::Utils::Text;
using namespace Umbra::Pipeline;

TEST(TextTest, StringHelpers) {
    EXPECT_EQ(trim("  \t padded \n"), "padded");
    EXPECT_EQ(to_lower("MiXeD"), "mixed");
    EXPECT_TRUE(starts_with("text/plain; charset=utf-8", "text/plain"));
    EXPECT_TRUE(ends_with("abc.onion", ".onion"));
    EXPECT_FALSE(ends_with("onion", ".onion"));
    EXPECT_EQ(split_whitespace(" a  b\tc\n").size(), 3u);
    EXPECT_EQ(collapse_whitespace("  a \n\n b   c "), "a b c");

    auto lines = split_lines("one\r\n\n  two  \nthree");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "two");

    std::vector<std::string> words = {"a", "b", "c", "d"};
    EXPECT_EQ(join(words, 1, 3, "-"), "b-c");
}

TEST(TextTest, ExtractVisibleText) {
    std::string html = R"html(
        <html><head><title> Market   Index </title><style>body{}</style></head>
        <body>
            <h1>Main Title</h1>
            <script>var hidden = 1;</script>
            <p>This is <b>bold</b> and <i>italic</i>.</p>
            <noscript>enable js</noscript>
        </body></html>
    )html";
    auto extracted = Converter::extract(html);

    EXPECT_EQ(extracted.title, "Market Index");
    EXPECT_NE(extracted.text.find("Main Title"), std::string::npos);
    EXPECT_NE(extracted.text.find("bold"), std::string::npos);
    EXPECT_EQ(extracted.text.find("hidden"), std::string::npos);
    EXPECT_EQ(extracted.text.find("body{}"), std::string::npos);
    EXPECT_EQ(extracted.text.find("enable js"), std::string::npos);
    EXPECT_EQ(extracted.text.find("  "), std::string::npos);
}

TEST(TextTest, MalformedHtml) {
    auto extracted = Converter::extract("<div><a>Unclosed tag<p>nested");
    EXPECT_EQ(extracted.title, "Untitled");
    EXPECT_EQ(extracted.text, "Unclosed tag nested");
    EXPECT_EQ(Converter::to_text(""), "");
}

TEST(TextTest, ChunkerWindows) {
    TextChunker chunker(50, 10);  // 10 words, 2 overlap
    EXPECT_EQ(chunker.words_per_chunk(), 10);
    EXPECT_EQ(chunker.step(), 8);

    std::string text;
    for (int i = 0; i < 20; ++i)
        text += "w" + std::to_string(i) + " ";
    auto chunks = chunker.chunk(text);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0], "w0 w1 w2 w3 w4 w5 w6 w7 w8 w9");
    EXPECT_EQ(chunks[1].substr(0, 6), "w8 w9 ");
    EXPECT_EQ(chunks[2], "w16 w17 w18 w19");
    EXPECT_TRUE(chunker.chunk("   ").empty());
}

TEST(TextTest, ChunkerRejectsNoForwardStep) {
    EXPECT_THROW(TextChunker(50, 50), std::invalid_argument);
    EXPECT_THROW(TextChunker(4, 0), std::invalid_argument);
}

TEST(TextTest, ProcessorAddsChunkMetadata) {
    HtmlContentProcessor        processor(TextChunker(50, 10));
    Umbra::Transport::RawDocument doc;
    doc.content_type = "text/html; charset=utf-8";
    doc.body         = "<html><head><title>Forum</title></head><body><p>"
               "one two three four five six seven eight nine ten eleven twelve</p></body></html>";

    auto processed = processor.process(doc, "abcdef");
    EXPECT_EQ(processed.title, "Forum");
    ASSERT_EQ(processed.chunks.size(), 2u);
    const auto& meta = processed.chunks[1].metadata;
    EXPECT_EQ(meta["content_address"], "abcdef");
    EXPECT_EQ(meta["title"], "Forum");
    EXPECT_EQ(meta["chunk_index"], 1);
    EXPECT_EQ(meta["total_chunks"], 2);
    EXPECT_TRUE(meta.contains("timestamp"));
}

TEST(TextTest, ProcessorEmptyDocument) {
    HtmlContentProcessor        processor(TextChunker(50, 10));
    Umbra::Transport::RawDocument doc;
    doc.content_type = "text/html";
    doc.body         = "<html><body><script>only()</script></body></html>";

    auto processed = processor.process(doc, "abcdef");
    EXPECT_EQ(processed.text_length, 0u);
    EXPECT_TRUE(processed.chunks.empty());
}
