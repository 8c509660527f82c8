#include "receiver.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "receive_session.hpp"
#include "util.hpp"
#include <chrono>
#include <filesystem>

namespace ferry {

static constexpr auto kAcceptRetryDelay = std::chrono::milliseconds(200);

Receiver::Receiver(asio::io_context &io, const ReceiverConfig &cfg,
                   TransferEvents events)
    : io_(io), cfg_(cfg), events_(std::move(events)), acceptor_(io),
      accept_retry_(io) {}

std::error_code Receiver::start() {
  std::string where = peer_string(cfg_.listen_host, cfg_.listen_port);
  std::error_code ec;
  auto addr = asio::ip::make_address(cfg_.listen_host, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "invalid listen address %s: %s",
                           cfg_.listen_host.c_str(), ec.message().c_str());
    events_.status("Error: Invalid address: " + cfg_.listen_host);
    return Errc::bind_error;
  }
  tcp::endpoint ep(addr, cfg_.listen_port);
  acceptor_.open(ep.protocol(), ec);
  if (!ec)
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if (!ec)
    acceptor_.bind(ep, ec);
  if (!ec)
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "bind %s failed: %s",
                           where.c_str(), ec.message().c_str());
    events_.status("Error binding to " + where + ": " + ec.message());
    std::error_code cec;
    acceptor_.close(cec);
    return Errc::bind_error;
  }
  auto local = acceptor_.local_endpoint(ec);
  bound_port_ = ec ? cfg_.listen_port : local.port();
  Logger::instance().log(LogLevel::INFO, "listening on %s, saving to %s",
                         peer_string(cfg_.listen_host, bound_port_).c_str(),
                         cfg_.dest_dir.c_str());
  events_.status("Listening on " + peer_string(cfg_.listen_host, bound_port_) +
                 " for incoming file transfers...");
  do_accept();
  return {};
}

void Receiver::stop() {
  stopping_.store(true);
  asio::post(io_, [this]() {
    accept_retry_.cancel();
    if (!acceptor_.is_open())
      return;
    std::error_code ec;
    acceptor_.close(ec);
    if (ec)
      Logger::instance().log(LogLevel::WARN, "closing acceptor: %s",
                             ec.message().c_str());
    Logger::instance().log(LogLevel::INFO, "receiver stopped after %llu sessions",
                           (unsigned long long)sessions_.load());
  });
}

Receiver::Interrupt Receiver::interrupt() {
  if (in_session_.load())
    return Interrupt::session_in_flight;
  stop();
  return Interrupt::stopping;
}

void Receiver::do_accept() {
  acceptor_.async_accept([this](std::error_code ec, tcp::socket sock) {
    if (ec == asio::error::operation_aborted || !acceptor_.is_open())
      return;
    if (ec) {
      // EMFILE and friends persist; wait before asking again.
      if (accept_failures_++ == 0 || Logger::instance().enabled(LogLevel::DEBUG))
        Logger::instance().log(LogLevel::ERROR, "accept failed: %s",
                               ec.message().c_str());
      retry_accept();
      return;
    }
    if (accept_failures_.exchange(0) > 0)
      Logger::instance().log(LogLevel::INFO, "accept recovered");
    if (stopping_.load())
      return;
    handle_connection(std::move(sock));
    if (acceptor_.is_open())
      do_accept();
  });
}

void Receiver::retry_accept() {
  accept_retry_.expires_after(kAcceptRetryDelay);
  accept_retry_.async_wait([this](std::error_code ec) {
    if (ec || !acceptor_.is_open())
      return;
    do_accept();
  });
}

void Receiver::handle_connection(tcp::socket sock) {
  in_session_.store(true);
  ReceiveSession session(sock, std::filesystem::path(cfg_.dest_dir), events_);
  TransferOutcome outcome = session.run();
  in_session_.store(false);
  std::error_code ec;
  sock.shutdown(tcp::socket::shutdown_both, ec);
  if (ec)
    Logger::instance().log(LogLevel::DEBUG, "shutdown %s: %s",
                           outcome.peer.c_str(), ec.message().c_str());
  sock.close(ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, "close %s: %s",
                           outcome.peer.c_str(), ec.message().c_str());
  sessions_++;
  events_.outcome(outcome);
  events_.status("Waiting for next file transfer...");
}

} // namespace ferry
