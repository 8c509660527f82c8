#include "util.hpp"
#include <algorithm>
#include <cctype>

namespace ferry {

static bool all_digits(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

bool parse_port(const std::string &s, uint16_t &port) {
  if (!all_digits(s) || s.size() > 5)
    return false;
  unsigned long p = std::stoul(s);
  if (p > 65535)
    return false;
  port = static_cast<uint16_t>(p);
  return true;
}

bool parse_size(const std::string &s, uint64_t &value) {
  if (!all_digits(s) || s.size() > 19)
    return false;
  value = std::stoull(s);
  return true;
}

bool parse_log_level(const std::string &s, LogLevel &lvl) {
  std::string l(s);
  std::transform(l.begin(), l.end(), l.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (l == "trace")
    lvl = LogLevel::TRACE;
  else if (l == "debug")
    lvl = LogLevel::DEBUG;
  else if (l == "info")
    lvl = LogLevel::INFO;
  else if (l == "warn" || l == "warning")
    lvl = LogLevel::WARN;
  else if (l == "error")
    lvl = LogLevel::ERROR;
  else
    return false;
  return true;
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

std::string peer_string(const std::string &host, uint16_t port) {
  if (host.find(':') != std::string::npos)
    return "[" + host + "]:" + std::to_string(port);
  return host + ":" + std::to_string(port);
}

} // namespace ferry
