#include "disk_document_store.hpp"
#include <fstream>
#include <system_error>
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"

namespace Umbra {
namespace Storage {

using namespace Umbra::Core;
namespace fs = std::filesystem;

DiskDocumentStore::DiskDocumentStore(const std::string& base_path) : base_path_(base_path) {
    std::error_code ec;
    fs::create_directories(base_path_, ec);
    if (ec) {
        throw StorageError("Failed to create storage directory " + base_path + ": "
                           + ec.message());
    }
}

fs::path DiskDocumentStore::path_for(const std::string& content_address) const {
    if (content_address.size() < 2 || content_address.find_first_of("/\\.") != std::string::npos) {
        throw StorageError("Invalid content-address");
    }
    return base_path_ / content_address.substr(0, 2) / (content_address + ".jsonl");
}

bool DiskDocumentStore::contains(const std::string& content_address) {
    std::error_code ec;
    bool            present = fs::exists(path_for(content_address), ec);
    if (ec) {
        throw StorageError("Metadata query failed: " + ec.message());
    }
    return present;
}

void DiskDocumentStore::store(const std::vector<Chunk>& chunks, const std::string& content_address) {
    fs::path path = path_for(content_address);
    fs::path tmp  = path;
    tmp += ".tmp";

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw StorageError("FS Error: " + ec.message());
    }

    {
        std::ofstream file(tmp, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw StorageError("Write Error: " + tmp.filename().string());
        }
        for (size_t i = 0; i < chunks.size(); ++i) {
            nlohmann::json record = {{"id", content_address + "_" + std::to_string(i)},
                                     {"text", chunks[i].text},
                                     {"metadata", chunks[i].metadata}};
            file << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        }
        file.flush();
        if (!file) {
            fs::remove(tmp, ec);
            throw StorageError("Write Error: " + tmp.filename().string());
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StorageError("Rename failed: " + ec.message());
    }
    Logger::success("Saved: " + path.filename().string().substr(0, 12) + " ("
                    + std::to_string(chunks.size()) + " chunks)");
}

}  // namespace Storage
}  // namespace Umbra
