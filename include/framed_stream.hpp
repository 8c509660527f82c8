#pragma once
#include <asio.hpp>
#include <cstdint>
#include <system_error>
#include "protocol.hpp"

namespace ferry {

// Blocking "10-digit length, then exact-length body" reads and writes on a
// connected socket. Read failures of any kind map to Errc::truncated_stream,
// write failures to Errc::connection_error. The transport error that caused
// the mapping is kept in last_transport_error().
class FramedStream {
public:
    using tcp = asio::ip::tcp;
    explicit FramedStream(tcp::socket& sock) : sock_(sock) {}

    std::error_code write_frame(const void* body, size_t len);
    // One frame followed by raw bytes that its body announces.
    std::error_code write_frame_with_tail(const void* body, size_t len,
                                          const void* tail, size_t tail_len);
    std::error_code write_end_marker();

    std::error_code read_header(uint64_t& len);
    std::error_code read_exact(void* dst, size_t len);

    uint64_t bytes_written() const { return written_; }
    uint64_t bytes_read() const { return read_; }
    const std::error_code& last_transport_error() const { return transport_ec_; }

private:
    std::error_code write_buffers(const asio::const_buffer* bufs, size_t count);

    tcp::socket& sock_;
    uint64_t written_{0};
    uint64_t read_{0};
    std::error_code transport_ec_;
};

} // namespace ferry
