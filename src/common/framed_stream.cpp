#include "framed_stream.hpp"
#include "errors.hpp"
#include <array>
#include <vector>

namespace ferry {

std::error_code FramedStream::write_buffers(const asio::const_buffer *bufs,
                                            size_t count) {
  std::vector<asio::const_buffer> seq(bufs, bufs + count);
  std::error_code ec;
  size_t n = asio::write(sock_, seq, ec);
  written_ += n;
  if (ec) {
    transport_ec_ = ec;
    return Errc::connection_error;
  }
  return {};
}

std::error_code FramedStream::write_frame(const void *body, size_t len) {
  auto hdr = encode_header(len);
  std::array<asio::const_buffer, 2> bufs = {
      asio::buffer(hdr), asio::const_buffer(body, len)};
  return write_buffers(bufs.data(), bufs.size());
}

std::error_code FramedStream::write_frame_with_tail(const void *body,
                                                    size_t len,
                                                    const void *tail,
                                                    size_t tail_len) {
  auto hdr = encode_header(len);
  std::array<asio::const_buffer, 3> bufs = {
      asio::buffer(hdr), asio::const_buffer(body, len),
      asio::const_buffer(tail, tail_len)};
  return write_buffers(bufs.data(), bufs.size());
}

std::error_code FramedStream::write_end_marker() {
  auto hdr = end_marker();
  asio::const_buffer buf = asio::buffer(hdr);
  return write_buffers(&buf, 1);
}

std::error_code FramedStream::read_header(uint64_t &len) {
  std::array<uint8_t, kHeaderWidth> raw{};
  std::error_code ec;
  size_t n = asio::read(sock_, asio::buffer(raw), ec);
  read_ += n;
  if (ec)
    transport_ec_ = ec;
  return decode_header(raw.data(), n, len);
}

std::error_code FramedStream::read_exact(void *dst, size_t len) {
  std::error_code ec;
  size_t n = asio::read(sock_, asio::buffer(dst, len), ec);
  read_ += n;
  if (ec || n != len) {
    transport_ec_ = ec;
    return Errc::truncated_stream;
  }
  return {};
}

} // namespace ferry
