#pragma once
#include "content_processor.hpp"
#include "text_chunker.hpp"

namespace Umbra {
namespace Pipeline {

class HtmlContentProcessor : public ContentProcessor {
public:
    explicit HtmlContentProcessor(TextChunker chunker);

    ProcessedDocument process(const Transport::RawDocument& document,
                              const std::string&            content_address) override;

private:
    TextChunker chunker_;
};

}  // namespace Pipeline
}  // namespace Umbra
