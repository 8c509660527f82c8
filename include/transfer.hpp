#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace ferry {

struct Progress {
    uint64_t bytes_done{0};
    uint64_t bytes_total{0};
    uint64_t chunk_index{0};   // 1-based index of the chunk just handled
    uint64_t chunk_count{0};   // 0 when unknown (receiver side)
    double percent() const {
        return bytes_total ? 100.0 * (double)bytes_done / (double)bytes_total : 100.0;
    }
};

struct TransferReport {
    std::string file_name;
    uint64_t file_size{0};
    uint64_t bytes_sent{0};
    uint64_t chunks_sent{0};
};

struct TransferOutcome {
    std::string peer;
    std::string file_name;
    std::string saved_path;
    uint64_t declared_size{0};
    uint64_t bytes_received{0};
    uint64_t chunks_received{0};
    std::vector<uint64_t> mismatched_chunks;  // 0-based chunk indices
    bool end_marker_seen{false};
    std::error_code error;
    std::string message;

    bool ok() const { return !error; }
    bool verified() const { return ok() && mismatched_chunks.empty(); }
};

// Optional observers. All are invoked on the thread running the transfer.
struct TransferEvents {
    std::function<void(const Progress&)> on_progress;
    std::function<void(const std::string&)> on_status;
    std::function<void(uint64_t chunk_index)> on_checksum_mismatch;
    std::function<void(const TransferOutcome&)> on_outcome;

    void progress(const Progress& p) const { if (on_progress) on_progress(p); }
    void status(const std::string& msg) const { if (on_status) on_status(msg); }
    void mismatch(uint64_t idx) const { if (on_checksum_mismatch) on_checksum_mismatch(idx); }
    void outcome(const TransferOutcome& o) const { if (on_outcome) on_outcome(o); }
};

} // namespace ferry
