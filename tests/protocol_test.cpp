/**
 * @file protocol_test.cpp
 * @brief Unit tests for the ferry wire codec
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <stdexcept>
#include <string>

#include "errors.hpp"
#include "protocol.hpp"

using namespace ferry;

namespace {

const uint8_t* bytes(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

} // namespace

TEST(HeaderCodec, EncodesZeroPaddedTenDigits) {
    EXPECT_EQ(encode_header_string(0), "0000000000");
    EXPECT_EQ(encode_header_string(26), "0000000026");
    EXPECT_EQ(encode_header_string(4096), "0000004096");
    EXPECT_EQ(encode_header_string(kMaxFrameLength), "9999999999");
}

TEST(HeaderCodec, RejectsValuesWiderThanTenDigits) {
    EXPECT_THROW(encode_header(kMaxFrameLength + 1), std::out_of_range);
    EXPECT_THROW(encode_header(UINT64_MAX), std::out_of_range);
}

TEST(HeaderCodec, DecodeInvertsEncodeAtBoundaries) {
    const std::initializer_list<uint64_t> values = {
        0, 1, 9, 10, 4095, 4096, 999999999, 1000000000, 1234567890, kMaxFrameLength};
    for (uint64_t n : values) {
        auto h = encode_header(n);
        uint64_t v = 12345;
        ASSERT_FALSE(decode_header(reinterpret_cast<const uint8_t*>(h.data()), h.size(), v));
        EXPECT_EQ(v, n);
    }
}

TEST(HeaderCodec, NonDigitBytesAreMalformed) {
    uint64_t v = 0;
    for (const char* bad : {"00000a0000", "+000000001", " 123456789", "-000000001",
                            "000000001\n", "          "}) {
        EXPECT_EQ(decode_header(bytes(bad), 10, v), make_error_code(Errc::malformed_header)) << bad;
    }
}

TEST(HeaderCodec, ShortInputIsTruncated) {
    uint64_t v = 0;
    EXPECT_EQ(decode_header(bytes("000000012"), 9, v), make_error_code(Errc::truncated_stream));
    EXPECT_EQ(decode_header(nullptr, 0, v), make_error_code(Errc::truncated_stream));
}

TEST(HeaderCodec, EndMarkerDecodesToZero) {
    auto m = end_marker();
    EXPECT_EQ(std::string(m.data(), m.size()), "0000000000");
    uint64_t v = 99;
    ASSERT_FALSE(decode_header(reinterpret_cast<const uint8_t*>(m.data()), m.size(), v));
    EXPECT_EQ(v, 0u);
}

TEST(MetadataCodec, EncodesNameAndSize) {
    EXPECT_EQ(encode_metadata({"report.pdf", 10000}), "report.pdf|10000");
    EXPECT_EQ(encode_metadata({"empty", 0}), "empty|0");
}

TEST(MetadataCodec, DecodesRecord) {
    FileMetadata m;
    std::string rec = "photo.jpg|123456";
    ASSERT_FALSE(decode_metadata(bytes(rec), rec.size(), m));
    EXPECT_EQ(m.name, "photo.jpg");
    EXPECT_EQ(m.size, 123456u);
}

TEST(MetadataCodec, SplitsAtLastDelimiter) {
    FileMetadata m;
    std::string rec = encode_metadata({"a|b|c.txt", 42});
    ASSERT_FALSE(decode_metadata(bytes(rec), rec.size(), m));
    EXPECT_EQ(m.name, "a|b|c.txt");
    EXPECT_EQ(m.size, 42u);
}

TEST(MetadataCodec, RejectsBadRecords) {
    FileMetadata m;
    for (const char* bad : {"nodelimiter", "|100", "name|", "name|12x", "name|-1",
                            "name|123456789012345678901"}) {
        std::string rec = bad;
        EXPECT_EQ(decode_metadata(bytes(rec), rec.size(), m),
                  make_error_code(Errc::malformed_header)) << bad;
    }
}

TEST(ChunkHeaderCodec, LayoutIsDigestThenTenDigitLength) {
    ChunkHeader h;
    for (size_t i = 0; i < kDigestSize; i++)
        h.checksum[i] = static_cast<uint8_t>(0xA0 + i);
    h.payload_len = 1808;
    auto rec = encode_chunk_header(h);
    ASSERT_EQ(rec.size(), 26u);
    EXPECT_EQ(std::memcmp(rec.data(), h.checksum.data(), kDigestSize), 0);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(rec.data()) + kDigestSize, kHeaderWidth),
              "0000001808");

    ChunkHeader back;
    ASSERT_FALSE(decode_chunk_header(rec.data(), rec.size(), back));
    EXPECT_EQ(back.checksum, h.checksum);
    EXPECT_EQ(back.payload_len, 1808u);
}

TEST(ChunkHeaderCodec, RejectsWrongSizeOrBadLength) {
    ChunkHeader h;
    h.payload_len = 7;
    auto rec = encode_chunk_header(h);
    ChunkHeader out;
    EXPECT_EQ(decode_chunk_header(rec.data(), rec.size() - 1, out),
              make_error_code(Errc::malformed_header));
    rec[kDigestSize + 3] = 'x';
    EXPECT_EQ(decode_chunk_header(rec.data(), rec.size(), out),
              make_error_code(Errc::malformed_header));
}

TEST(ErrorCategory, NamesEveryKind) {
    EXPECT_STREQ(transfer_category().name(), "ferry");
    std::error_code ec = Errc::checksum_mismatch;
    EXPECT_EQ(ec.message(), "checksum mismatch");
    EXPECT_EQ(std::error_code(Errc::truncated_stream).message(), "truncated stream");
    EXPECT_EQ(std::error_code(Errc::bind_error).message(), "bind error");
    EXPECT_NE(std::error_code(Errc::connection_error), std::error_code(Errc::file_access_error));
}
