#pragma once
#include <string>
#include <vector>
#include "../storage/document_store.hpp"
#include "../transport/transport_router.hpp"

namespace Umbra {
namespace Pipeline {

struct ProcessedDocument {
    std::string                 title;
    std::size_t                 text_length = 0;
    std::vector<Storage::Chunk> chunks;
};

class ContentProcessor {
public:
    virtual ~ContentProcessor() = default;

    virtual ProcessedDocument process(const Transport::RawDocument& document,
                                      const std::string&            content_address) = 0;
};

}  // namespace Pipeline
}  // namespace Umbra
