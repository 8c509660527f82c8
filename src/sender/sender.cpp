#include "sender.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "framed_stream.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace ferry {

Sender::Sender(asio::io_context &io, TransferEvents events)
    : io_(io), events_(std::move(events)) {}

std::error_code Sender::connect(tcp::socket &sock, const std::string &host,
                                uint16_t port) {
  std::error_code ec;
  tcp::resolver res(io_);
  auto results = res.resolve(host, std::to_string(port), ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "resolve %s failed: %s",
                           host.c_str(), ec.message().c_str());
    events_.status("Error: Invalid address or hostname: " + host);
    return Errc::connection_error;
  }
  asio::connect(sock, results, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "connect %s failed: %s",
                           peer_string(host, port).c_str(),
                           ec.message().c_str());
    events_.status("Error: Could not connect to " + peer_string(host, port) +
                   " (" + ec.message() + ")");
    return Errc::connection_error;
  }
  return {};
}

std::error_code Sender::send(const SendRequest &req, TransferReport &report) {
  if (req.chunk_size == 0 || req.chunk_size > kMaxFrameLength)
    throw std::invalid_argument("chunk size must be in [1, 9999999999]");

  std::error_code fec;
  fs::path path(req.file_path);
  if (!fs::is_regular_file(path, fec)) {
    Logger::instance().log(LogLevel::ERROR, "source %s is not a readable file",
                           req.file_path.c_str());
    events_.status("Error: File '" + req.file_path + "' not found");
    return Errc::file_access_error;
  }
  uint64_t file_size = fs::file_size(path, fec);
  std::ifstream in(path, std::ios::binary);
  if (fec || !in) {
    Logger::instance().log(LogLevel::ERROR, "cannot open %s for reading",
                           req.file_path.c_str());
    events_.status("Error: Cannot read '" + req.file_path + "'");
    return Errc::file_access_error;
  }

  report = TransferReport{};
  report.file_name = path.filename().string();
  report.file_size = file_size;
  events_.status("Sending file: " + report.file_name + " (" +
                 std::to_string(file_size) + " bytes)");
  events_.status("Connecting to " + peer_string(req.host, req.port) + "...");

  tcp::socket sock(io_);
  if (auto ec = connect(sock, req.host, req.port))
    return ec;

  FramedStream stream(sock);
  std::string meta = encode_metadata({report.file_name, file_size});
  if (auto ec = stream.write_frame(meta.data(), meta.size())) {
    Logger::instance().log(LogLevel::ERROR, "metadata frame write failed: %s",
                           stream.last_transport_error().message().c_str());
    events_.status("Error: Failed to send metadata frame");
    return ec;
  }
  Logger::instance().log(LogLevel::DEBUG, "sent metadata %s|%llu",
                         report.file_name.c_str(),
                         (unsigned long long)file_size);

  uint64_t chunk_count = (file_size + req.chunk_size - 1) / req.chunk_size;
  std::vector<uint8_t> buf(static_cast<size_t>(
      std::min<uint64_t>(req.chunk_size, std::max<uint64_t>(file_size, 1))));
  uint64_t remaining = file_size;
  while (remaining > 0) {
    size_t n = static_cast<size_t>(std::min<uint64_t>(buf.size(), remaining));
    in.read(reinterpret_cast<char *>(buf.data()), (std::streamsize)n);
    if ((size_t)in.gcount() != n) {
      Logger::instance().log(
          LogLevel::ERROR, "read of chunk %llu from %s failed (%llu bytes left)",
          (unsigned long long)report.chunks_sent, req.file_path.c_str(),
          (unsigned long long)remaining);
      events_.status("Error: Source file ended early at chunk " +
                     std::to_string(report.chunks_sent + 1));
      return Errc::file_access_error;
    }

    ChunkHeader ch;
    ch.checksum = chunk_digest(buf.data(), n);
    ch.payload_len = n;
    auto rec = encode_chunk_header(ch);
    if (auto ec = stream.write_frame_with_tail(rec.data(), rec.size(),
                                               buf.data(), n)) {
      Logger::instance().log(LogLevel::ERROR, "chunk %llu write failed: %s",
                             (unsigned long long)report.chunks_sent,
                             stream.last_transport_error().message().c_str());
      events_.status("Error: Connection lost while sending chunk " +
                     std::to_string(report.chunks_sent + 1));
      return ec;
    }
    remaining -= n;
    report.bytes_sent += n;
    report.chunks_sent++;
    Logger::instance().log(LogLevel::TRACE, "chunk %llu len=%zu digest=%s",
                           (unsigned long long)report.chunks_sent - 1, n,
                           bytes_to_hex(ch.checksum.data(), ch.checksum.size())
                               .c_str());
    events_.progress(
        Progress{report.bytes_sent, file_size, report.chunks_sent, chunk_count});
  }

  if (auto ec = stream.write_end_marker()) {
    Logger::instance().log(LogLevel::ERROR, "end marker write failed: %s",
                           stream.last_transport_error().message().c_str());
    events_.status("Error: Failed to send end marker");
    return ec;
  }

  std::error_code sec;
  sock.shutdown(tcp::socket::shutdown_send, sec);
  if (sec)
    Logger::instance().log(LogLevel::DEBUG, "shutdown after end marker: %s",
                           sec.message().c_str());
  Logger::instance().log(
      LogLevel::INFO, "sent %s: %llu bytes in %llu chunks (%llu on the wire)",
      report.file_name.c_str(), (unsigned long long)report.bytes_sent,
      (unsigned long long)report.chunks_sent,
      (unsigned long long)stream.bytes_written());
  events_.status("File sent successfully!");
  return {};
}

} // namespace ferry
