#include "protocol.hpp"
#include "errors.hpp"
#include <cstring>
#include <limits>
#include <stdexcept>

namespace ferry {

namespace {

bool parse_decimal(const uint8_t *data, size_t n, uint64_t &value) {
  if (n == 0)
    return false;
  uint64_t v = 0;
  for (size_t i = 0; i < n; i++) {
    if (data[i] < '0' || data[i] > '9')
      return false;
    uint64_t d = data[i] - '0';
    if (v > (std::numeric_limits<uint64_t>::max() - d) / 10)
      return false;
    v = v * 10 + d;
  }
  value = v;
  return true;
}

} // namespace

HeaderBytes encode_header(uint64_t len) {
  if (len > kMaxFrameLength)
    throw std::out_of_range("frame length " + std::to_string(len) +
                            " does not fit in a 10-digit header");
  HeaderBytes out;
  for (size_t i = kHeaderWidth; i > 0; i--) {
    out[i - 1] = static_cast<char>('0' + len % 10);
    len /= 10;
  }
  return out;
}

std::string encode_header_string(uint64_t len) {
  auto h = encode_header(len);
  return std::string(h.data(), h.size());
}

std::error_code decode_header(const uint8_t *data, size_t n,
                              uint64_t &value) {
  if (n < kHeaderWidth)
    return Errc::truncated_stream;
  if (!parse_decimal(data, kHeaderWidth, value))
    return Errc::malformed_header;
  return {};
}

HeaderBytes end_marker() { return encode_header(0); }

std::string encode_metadata(const FileMetadata &meta) {
  return meta.name + kMetadataDelimiter + std::to_string(meta.size);
}

std::error_code decode_metadata(const uint8_t *data, size_t n,
                                FileMetadata &meta) {
  std::string rec(reinterpret_cast<const char *>(data), n);
  auto pos = rec.rfind(kMetadataDelimiter);
  if (pos == std::string::npos || pos == 0)
    return Errc::malformed_header;
  size_t digits = rec.size() - pos - 1;
  if (digits > 20)
    return Errc::malformed_header;
  uint64_t size = 0;
  if (!parse_decimal(data + pos + 1, digits, size))
    return Errc::malformed_header;
  meta.name = rec.substr(0, pos);
  meta.size = size;
  return {};
}

ChunkHeaderBytes encode_chunk_header(const ChunkHeader &hdr) {
  ChunkHeaderBytes out{};
  std::memcpy(out.data(), hdr.checksum.data(), kDigestSize);
  auto len = encode_header(hdr.payload_len);
  std::memcpy(out.data() + kDigestSize, len.data(), kHeaderWidth);
  return out;
}

std::error_code decode_chunk_header(const uint8_t *data, size_t n,
                                    ChunkHeader &hdr) {
  if (n != kChunkHeaderSize)
    return Errc::malformed_header;
  ChunkHeader h;
  std::memcpy(h.checksum.data(), data, kDigestSize);
  if (auto ec = decode_header(data + kDigestSize, kHeaderWidth, h.payload_len))
    return ec;
  hdr = h;
  return {};
}

} // namespace ferry
