#include "receive_session.hpp"
#include "checksum.hpp"
#include "destination.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <vector>

namespace ferry {

static constexpr size_t kReadPiece = 64 * 1024;

ReceiveSession::ReceiveSession(tcp::socket &sock,
                               std::filesystem::path dest_dir,
                               const TransferEvents &events)
    : sock_(sock), stream_(sock), dest_dir_(std::move(dest_dir)),
      events_(events) {
  std::error_code ec;
  auto ep = sock_.remote_endpoint(ec);
  outcome_.peer =
      ec ? "unknown" : peer_string(ep.address().to_string(), ep.port());
}

std::error_code ReceiveSession::fail(std::error_code ec,
                                     const std::string &what) {
  outcome_.error = ec;
  outcome_.message = what + ": " + ec.message();
  if (stream_.last_transport_error())
    outcome_.message += " (" + stream_.last_transport_error().message() + ")";
  Logger::instance().log(LogLevel::ERROR,
                         "session %s aborted after %llu bytes: %s",
                         outcome_.peer.c_str(),
                         (unsigned long long)stream_.bytes_read(),
                         outcome_.message.c_str());
  events_.status("Error: " + outcome_.message);
  if (out_.is_open())
    out_.close();
  return ec;
}

std::error_code ReceiveSession::read_metadata() {
  uint64_t len = 0;
  if (auto ec = stream_.read_header(len))
    return fail(ec, "metadata frame header");
  if (len == 0 || len > kMaxMetadataSize)
    return fail(Errc::malformed_header,
                "metadata frame length " + std::to_string(len));
  std::vector<uint8_t> body(static_cast<size_t>(len));
  if (auto ec = stream_.read_exact(body.data(), body.size()))
    return fail(ec, "metadata frame body");
  FileMetadata meta;
  if (auto ec = decode_metadata(body.data(), body.size(), meta))
    return fail(ec, "metadata record");
  outcome_.file_name = meta.name;
  outcome_.declared_size = meta.size;
  return {};
}

std::error_code ReceiveSession::open_destination() {
  std::string name = sanitize_file_name(outcome_.file_name);
  if (name.empty())
    return fail(Errc::malformed_header,
                "metadata file name '" + outcome_.file_name + "'");
  auto path = resolve_destination(dest_dir_, name);
  if (path.empty())
    return fail(Errc::file_access_error,
                "destination directory " + dest_dir_.string());
  out_.open(path, std::ios::binary | std::ios::trunc);
  if (!out_)
    return fail(Errc::file_access_error,
                "destination " + path.string());
  outcome_.saved_path = path.string();
  events_.status("Receiving file: " + outcome_.file_name + " (" +
                 std::to_string(outcome_.declared_size) + " bytes)");
  return {};
}

std::error_code ReceiveSession::read_chunk(uint64_t chunk_len) {
  uint64_t index = outcome_.chunks_received;
  std::string unit = "chunk " + std::to_string(index);
  if (chunk_len != kChunkHeaderSize)
    return fail(Errc::malformed_header,
                unit + " header length " + std::to_string(chunk_len));
  ChunkHeaderBytes rec{};
  if (auto ec = stream_.read_exact(rec.data(), rec.size()))
    return fail(ec, unit + " header");
  ChunkHeader hdr;
  if (auto ec = decode_chunk_header(rec.data(), rec.size(), hdr))
    return fail(ec, unit + " header");

  ChunkHasher hasher;
  std::vector<uint8_t> piece(
      static_cast<size_t>(std::min<uint64_t>(kReadPiece, hdr.payload_len)));
  uint64_t remaining = hdr.payload_len;
  while (remaining > 0) {
    size_t n = static_cast<size_t>(std::min<uint64_t>(piece.size(), remaining));
    if (auto ec = stream_.read_exact(piece.data(), n)) {
      outcome_.bytes_received += hdr.payload_len - remaining;
      return fail(ec, unit + " payload (" +
                          std::to_string(hdr.payload_len - remaining) + " of " +
                          std::to_string(hdr.payload_len) + " bytes)");
    }
    hasher.update(piece.data(), n);
    out_.write(reinterpret_cast<const char *>(piece.data()),
               (std::streamsize)n);
    if (!out_)
      return fail(Errc::file_access_error,
                  unit + " write to " + outcome_.saved_path);
    remaining -= n;
  }

  if (hasher.finish() != hdr.checksum) {
    outcome_.mismatched_chunks.push_back(index);
    std::error_code mec = Errc::checksum_mismatch;
    Logger::instance().log(LogLevel::WARN, "%s from %s: %s, keeping data",
                           unit.c_str(), outcome_.peer.c_str(),
                           mec.message().c_str());
    events_.status("Warning: Checksum mismatch on chunk " +
                   std::to_string(index + 1) + ". Data may be corrupted.");
    events_.mismatch(index);
  }
  outcome_.bytes_received += hdr.payload_len;
  outcome_.chunks_received++;
  events_.progress(Progress{outcome_.bytes_received, outcome_.declared_size,
                            outcome_.chunks_received, 0});
  return {};
}

TransferOutcome ReceiveSession::run() {
  Logger::instance().log(LogLevel::INFO, "session from %s",
                         outcome_.peer.c_str());
  events_.status("Connected by " + outcome_.peer);
  if (read_metadata() || open_destination())
    return outcome_;

  for (;;) {
    uint64_t len = 0;
    if (auto ec = stream_.read_header(len)) {
      fail(ec, "chunk " + std::to_string(outcome_.chunks_received) +
                   " frame header");
      return outcome_;
    }
    if (len == 0)
      break;
    if (read_chunk(len))
      return outcome_;
  }

  outcome_.end_marker_seen = true;
  out_.close();
  if (!out_) {
    fail(Errc::file_access_error, "closing " + outcome_.saved_path);
    return outcome_;
  }

  if (outcome_.bytes_received != outcome_.declared_size) {
    outcome_.message = "received " + std::to_string(outcome_.bytes_received) +
                       " bytes, metadata declared " +
                       std::to_string(outcome_.declared_size);
    Logger::instance().log(LogLevel::WARN, "%s: %s", outcome_.file_name.c_str(),
                           outcome_.message.c_str());
    events_.status("Warning: " + outcome_.message);
  }
  if (!outcome_.mismatched_chunks.empty())
    events_.status("File received with " +
                   std::to_string(outcome_.mismatched_chunks.size()) +
                   " corrupted chunks. Data integrity might be compromised.");
  else
    events_.status("File received successfully with verified integrity.");
  events_.status("Saved as: " + outcome_.saved_path);
  Logger::instance().log(
      LogLevel::INFO, "saved %s: %llu bytes, %llu chunks, %zu mismatched",
      outcome_.saved_path.c_str(), (unsigned long long)outcome_.bytes_received,
      (unsigned long long)outcome_.chunks_received,
      outcome_.mismatched_chunks.size());
  return outcome_;
}

} // namespace ferry
