#pragma once
#include <asio.hpp>
#include <string>
#include <system_error>
#include "protocol.hpp"
#include "transfer.hpp"

namespace ferry {

struct SendRequest {
    std::string file_path;
    std::string host;
    uint16_t port{};
    uint64_t chunk_size{kDefaultChunkSize};
};

class Sender {
public:
    using tcp = asio::ip::tcp;
    explicit Sender(asio::io_context& io, TransferEvents events = {});

    // Blocks until the whole file and the end marker are written.
    // Throws std::invalid_argument for a chunk size outside [1, 10^10).
    std::error_code send(const SendRequest& req, TransferReport& report);

private:
    std::error_code connect(tcp::socket& sock, const std::string& host, uint16_t port);

    asio::io_context& io_;
    TransferEvents events_;
};

} // namespace ferry
