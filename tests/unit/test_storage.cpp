#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/errors/errors.hpp"
#include "../../src/storage/disk_document_store.hpp"
#include "../../src/utils/crypto/digest.hpp"

using namespace Umbra::Storage;
using Umbra::Core::StorageError;
namespace fs = std::filesystem;

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    void TearDown() override {
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    std::string address_ = Umbra::Utils::Crypto::sha256_hex("http://stored.onion/");
};

TEST_F(StorageTest, StoreWritesJsonLines) {
    DiskDocumentStore store("test_storage_out");
    EXPECT_FALSE(store.contains(address_));

    std::vector<Chunk> chunks = {{"first chunk", {{"chunk_index", 0}}}, {"second chunk", {{"chunk_index", 1}}}};
    store.store(chunks, address_);

    EXPECT_TRUE(store.contains(address_));
    fs::path path = store.path_for(address_);
    EXPECT_EQ(path.parent_path().filename().string(), address_.substr(0, 2));
    EXPECT_FALSE(fs::exists(path.string() + ".tmp"));

    std::ifstream            file(path);
    std::vector<std::string> lines;
    std::string              line;
    while (std::getline(file, line))
        lines.push_back(line);
    ASSERT_EQ(lines.size(), 2u);

    auto record = nlohmann::json::parse(lines[1]);
    EXPECT_EQ(record["id"], address_ + "_1");
    EXPECT_EQ(record["text"], "second chunk");
    EXPECT_EQ(record["metadata"]["chunk_index"], 1);
}

TEST_F(StorageTest, InvalidUtf8IsReplaced) {
    DiskDocumentStore store("test_storage_out");
    std::string       broken = "bad \xC3\x28 bytes";
    EXPECT_NO_THROW(store.store({{broken, nlohmann::json::object()}}, address_));
    EXPECT_TRUE(store.contains(address_));
}

TEST_F(StorageTest, RejectsPathLikeAddresses) {
    DiskDocumentStore store("test_storage_out");
    EXPECT_THROW(store.path_for("../etc/passwd"), StorageError);
    EXPECT_THROW(store.path_for("a"), StorageError);
    EXPECT_THROW(store.store({}, "ab/cd"), StorageError);
}

TEST_F(StorageTest, UnwritableBaseThrows) {
    std::ofstream("test_storage_out_file") << "not a directory";
    EXPECT_THROW(DiskDocumentStore("test_storage_out_file/nested"), StorageError);
    fs::remove("test_storage_out_file");
}
