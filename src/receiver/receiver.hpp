#pragma once
#include <asio.hpp>
#include <atomic>
#include <string>
#include <system_error>
#include "transfer.hpp"

namespace ferry {

struct ReceiverConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{};
    std::string dest_dir{"."};
};

// Accepts connections on the io_context and runs each transfer session to
// completion inside the accept handler, so sessions never overlap. Later
// connections wait in the listen backlog.
class Receiver {
public:
    using tcp = asio::ip::tcp;
    Receiver(asio::io_context& io, const ReceiverConfig& cfg, TransferEvents events = {});

    // Binds, listens and queues the first accept. Errc::bind_error on failure.
    std::error_code start();
    // Safe from any thread; takes effect once the current session ends.
    void stop();

    enum class Interrupt { stopping, session_in_flight };
    // Signal entry point, safe from any thread. When idle the receiver is
    // stopped. A session blocked in I/O cannot be cancelled, so the caller
    // is told to terminate instead.
    Interrupt interrupt();

    uint16_t port() const { return bound_port_; }
    uint64_t sessions_handled() const { return sessions_.load(); }
    bool session_active() const { return in_session_.load(); }
    uint64_t accept_failures() const { return accept_failures_.load(); }

private:
    void do_accept();
    void retry_accept();
    void handle_connection(tcp::socket sock);

    asio::io_context& io_;
    ReceiverConfig cfg_;
    TransferEvents events_;
    tcp::acceptor acceptor_;
    asio::steady_timer accept_retry_;
    uint16_t bound_port_{0};
    std::atomic<uint64_t> sessions_{0};
    std::atomic<uint64_t> accept_failures_{0};
    std::atomic<bool> in_session_{false};
    std::atomic<bool> stopping_{false};
};

} // namespace ferry
