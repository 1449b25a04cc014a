#pragma once
#include <filesystem>
#include <string>
#include "document_store.hpp"

namespace Umbra {
namespace Storage {

// <base>/<first two hex chars>/<content-address>.jsonl
class DiskDocumentStore : public DocumentStore {
public:
    explicit DiskDocumentStore(const std::string& base_path);
    ~DiskDocumentStore() override = default;

    bool contains(const std::string& content_address) override;
    void store(const std::vector<Chunk>& chunks, const std::string& content_address) override;

    std::filesystem::path path_for(const std::string& content_address) const;

private:
    std::filesystem::path base_path_;
};

}  // namespace Storage
}  // namespace Umbra
