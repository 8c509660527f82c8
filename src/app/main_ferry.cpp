#include "logging.hpp"
#include "receiver.hpp"
#include "sender.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ferry;

static void usage() {
  std::cerr << "Usage:\n"
            << "  ferry send <filepath> <ip> <port> [--chunk-size N] "
               "[--log-level L]\n"
            << "  ferry recv <ip> <port> [--dir D] [--log-level L]\n";
}

static TransferEvents console_events() {
  TransferEvents ev;
  ev.on_status = [](const std::string &msg) { std::cout << msg << std::endl; };
  ev.on_progress = [](const Progress &p) {
    std::printf("\r%llu", (unsigned long long)p.chunk_index);
    if (p.chunk_count)
      std::printf("/%llu", (unsigned long long)p.chunk_count);
    std::printf(" chunks (%llu/%llu bytes - %.1f%%)",
                (unsigned long long)p.bytes_done,
                (unsigned long long)p.bytes_total, p.percent());
    if (p.bytes_done >= p.bytes_total)
      std::printf("\n");
    std::fflush(stdout);
  };
  return ev;
}

static int run_send(const std::vector<std::string> &pos, uint64_t chunk_size) {
  if (pos.size() != 3) {
    std::cerr << "Error: send takes <filepath> <ip> <port>\n";
    usage();
    return 2;
  }
  SendRequest req;
  req.file_path = pos[0];
  req.host = pos[1];
  req.chunk_size = chunk_size;
  if (!parse_port(pos[2], req.port) || req.port == 0) {
    std::cerr << "Error: Invalid port number: " << pos[2] << "\n";
    return 2;
  }

  asio::io_context io;
  Sender sender(io, console_events());
  TransferReport report;
  auto ec = sender.send(req, report);
  if (ec) {
    std::cerr << "send failed: " << ec.message() << std::endl;
    return 1;
  }
  return 0;
}

static int run_recv(const std::vector<std::string> &pos,
                    const std::string &dir) {
  if (pos.size() != 2) {
    std::cerr << "Error: recv takes <ip> <port>\n";
    usage();
    return 2;
  }
  ReceiverConfig cfg;
  cfg.listen_host = pos[0];
  cfg.dest_dir = dir;
  if (!parse_port(pos[1], cfg.listen_port)) {
    std::cerr << "Error: Invalid port number: " << pos[1] << "\n";
    return 2;
  }

  asio::io_context io;
  Receiver receiver(io, cfg, console_events());
  if (receiver.start())
    return 1;

  // Signals get their own thread: the receive thread may sit in a blocking
  // read for as long as a stalled peer keeps the connection open.
  asio::io_context sig_io;
  asio::signal_set signals(sig_io, SIGINT, SIGTERM);
  std::function<void()> arm;
  arm = [&]() {
    signals.async_wait([&](std::error_code ec, int sig) {
      if (ec)
        return;
      if (receiver.interrupt() == Receiver::Interrupt::session_in_flight) {
        Logger::instance().log(LogLevel::WARN,
                               "signal %d during a transfer, terminating", sig);
        std::cout << "\nReceiver stopped by user." << std::endl;
        std::fflush(nullptr);
        std::_Exit(0);
      }
      Logger::instance().log(LogLevel::INFO, "signal %d, stopping receiver",
                             sig);
      std::cout << "\nStopping receiver..." << std::endl;
      arm();
    });
  };
  arm();
  std::thread sig_thread([&]() { sig_io.run(); });

  io.run();
  sig_io.stop();
  sig_thread.join();
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Error: Missing command\n";
    usage();
    return 2;
  }
  std::string cmd = argv[1];
  std::vector<std::string> pos;
  uint64_t chunk_size = kDefaultChunkSize;
  std::string dir = ".";

  for (int i = 2; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(2);
    };
    if (a == "--chunk-size") {
      std::string v = next(i);
      if (!parse_size(v, chunk_size) || chunk_size == 0 ||
          chunk_size > kMaxFrameLength) {
        std::cerr << "bad chunk size " << v << "\n";
        return 2;
      }
    } else if (a == "--dir") {
      dir = next(i);
    } else if (a == "--log-level") {
      std::string v = next(i);
      LogLevel lvl;
      if (!parse_log_level(v, lvl)) {
        std::cerr << "bad log level " << v << "\n";
        return 2;
      }
      Logger::instance().set_level(lvl);
    } else {
      pos.push_back(a);
    }
  }

  try {
    if (cmd == "send")
      return run_send(pos, chunk_size);
    if (cmd == "recv")
      return run_recv(pos, dir);
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::ERROR, "%s", e.what());
    return 1;
  }
  std::cerr << "Error: Unknown command: " << cmd << "\n";
  usage();
  return 2;
}
