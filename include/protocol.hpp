#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace ferry {

// Every frame starts with a zero-padded decimal length of this many chars.
constexpr size_t   kHeaderWidth = 10;
constexpr uint64_t kMaxFrameLength = 9999999999ull;
constexpr size_t   kDigestSize = 16;
constexpr size_t   kChunkHeaderSize = kDigestSize + kHeaderWidth;
constexpr size_t   kMaxMetadataSize = 4096;
constexpr uint64_t kDefaultChunkSize = 4096;
constexpr char     kMetadataDelimiter = '|';

using Digest = std::array<uint8_t, kDigestSize>;
using HeaderBytes = std::array<char, kHeaderWidth>;

struct FileMetadata {
    std::string name;
    uint64_t size{0};
};

// Wire layout: 16 raw digest bytes, then payload_len as a 10-digit header.
struct ChunkHeader {
    Digest checksum{};
    uint64_t payload_len{0};
};

using ChunkHeaderBytes = std::array<uint8_t, kChunkHeaderSize>;

// Throws std::out_of_range when len does not fit in kHeaderWidth digits.
HeaderBytes encode_header(uint64_t len);
std::string encode_header_string(uint64_t len);
std::error_code decode_header(const uint8_t* data, size_t n, uint64_t& value);

HeaderBytes end_marker();

std::string encode_metadata(const FileMetadata& meta);
std::error_code decode_metadata(const uint8_t* data, size_t n, FileMetadata& meta);

ChunkHeaderBytes encode_chunk_header(const ChunkHeader& hdr);
std::error_code decode_chunk_header(const uint8_t* data, size_t n, ChunkHeader& hdr);

} // namespace ferry
