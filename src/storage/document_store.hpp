#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Umbra {
namespace Storage {

struct Chunk {
    std::string    text;
    nlohmann::json metadata = nlohmann::json::object();
};

class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    // Metadata query backing the dedup record.
    virtual bool contains(const std::string& content_address) = 0;

    // Stores all chunks of one document. Throws Core::StorageError.
    virtual void store(const std::vector<Chunk>& chunks, const std::string& content_address) = 0;
};

}  // namespace Storage
}  // namespace Umbra
