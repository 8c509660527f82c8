/**
 * @file checksum_test.cpp
 * @brief Per-chunk digest tests
 */

#include <gtest/gtest.h>
#include <numeric>
#include <vector>

#include "checksum.hpp"
#include "util.hpp"

using namespace ferry;

TEST(ChunkDigest, IsSixteenBytesAndDeterministic) {
    std::vector<uint8_t> data(4096);
    std::iota(data.begin(), data.end(), 0);
    Digest a = chunk_digest(data.data(), data.size());
    Digest b = chunk_digest(data.data(), data.size());
    EXPECT_EQ(a.size(), 16u);
    EXPECT_EQ(a, b);
}

TEST(ChunkDigest, EmptyPayloadHasStableDigest) {
    Digest a = chunk_digest(nullptr, 0);
    Digest b = chunk_digest(nullptr, 0);
    EXPECT_EQ(a, b);
    EXPECT_EQ(bytes_to_hex(a.data(), a.size()).size(), 32u);
}

TEST(ChunkDigest, IncrementalMatchesOneShot) {
    std::vector<uint8_t> data(10000);
    for (size_t i = 0; i < data.size(); i++)
        data[i] = static_cast<uint8_t>(i * 31 + 7);
    ChunkHasher h;
    h.update(data.data(), 1);
    h.update(data.data() + 1, 4095);
    h.update(data.data() + 4096, data.size() - 4096);
    EXPECT_EQ(h.finish(), chunk_digest(data.data(), data.size()));
}

TEST(ChunkDigest, EverySingleBitFlipChangesDigest) {
    std::vector<uint8_t> data(64);
    for (size_t i = 0; i < data.size(); i++)
        data[i] = static_cast<uint8_t>(i ^ 0x5A);
    Digest clean = chunk_digest(data.data(), data.size());
    for (size_t byte = 0; byte < data.size(); byte++) {
        for (int bit = 0; bit < 8; bit++) {
            data[byte] ^= static_cast<uint8_t>(1u << bit);
            EXPECT_NE(chunk_digest(data.data(), data.size()), clean)
                << "byte " << byte << " bit " << bit;
            data[byte] ^= static_cast<uint8_t>(1u << bit);
        }
    }
}
