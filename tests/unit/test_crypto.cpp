#include <gtest/gtest.h>
#include <thread>
#include <unordered_set>
#include "../../src/utils/crypto/digest.hpp"

using namespace Umbra::Utils::Crypto;

TEST(CryptoTest, KnownDigests) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoTest, DistinctInputsDistinctDigests) {
    std::unordered_set<std::string> digests;
    for (int i = 0; i < 1000; ++i)
        digests.insert(sha256_hex("http://target_" + std::to_string(i) + ".onion/"));
    EXPECT_EQ(digests.size(), 1000u);
}

TEST(CryptoTest, DigestConcurrency) {
    std::vector<std::thread> threads;
    std::vector<std::string> results(8);
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&results, i]() {
            for (int j = 0; j < 100; ++j)
                results[i] = sha256_hex("same input");
        });
    }
    for (auto& t : threads)
        t.join();
    for (const auto& digest : results)
        EXPECT_EQ(digest, results[0]);
}
