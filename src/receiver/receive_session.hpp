#pragma once
#include <asio.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include "framed_stream.hpp"
#include "transfer.hpp"

namespace ferry {

// One accepted connection: metadata frame, chunks, end marker.
class ReceiveSession {
public:
    using tcp = asio::ip::tcp;
    ReceiveSession(tcp::socket& sock, std::filesystem::path dest_dir,
                   const TransferEvents& events);
    TransferOutcome run();

private:
    std::error_code read_metadata();
    std::error_code open_destination();
    std::error_code read_chunk(uint64_t chunk_len);
    std::error_code fail(std::error_code ec, const std::string& what);

    tcp::socket& sock_;
    FramedStream stream_;
    std::filesystem::path dest_dir_;
    const TransferEvents& events_;
    std::ofstream out_;
    TransferOutcome outcome_;
};

} // namespace ferry
