#include "html_content_processor.hpp"
#include <chrono>
#include "../utils/text/converter.hpp"
#include "../utils/text/string_utils.hpp"

namespace Umbra {
namespace Pipeline {

using namespace Umbra::Utils::Text;

HtmlContentProcessor::HtmlContentProcessor(TextChunker chunker) : chunker_(std::move(chunker)) {
}

ProcessedDocument HtmlContentProcessor::process(const Transport::RawDocument& document,
                                                const std::string&            content_address) {
    Converter::Extracted extracted;
    std::string          type = to_lower(document.content_type);
    if (starts_with(type, "text/plain")) {
        extracted.title = "Untitled";
        extracted.text  = collapse_whitespace(document.body);
    }
    else {
        extracted = Converter::extract(document.body);
    }

    ProcessedDocument result;
    result.title       = extracted.title;
    result.text_length = extracted.text.size();
    if (extracted.text.empty())
        return result;

    auto   pieces    = chunker_.chunk(extracted.text);
    double timestamp = std::chrono::duration<double>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
    for (size_t i = 0; i < pieces.size(); ++i) {
        Storage::Chunk chunk;
        chunk.text     = std::move(pieces[i]);
        chunk.metadata = {{"content_address", content_address},
                          {"title", extracted.title},
                          {"chunk_index", i},
                          {"total_chunks", pieces.size()},
                          {"timestamp", timestamp}};
        result.chunks.push_back(std::move(chunk));
    }
    return result;
}

}  // namespace Pipeline
}  // namespace Umbra
