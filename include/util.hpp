#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include "logging.hpp"

namespace ferry {

bool parse_port(const std::string& s, uint16_t& port);
bool parse_size(const std::string& s, uint64_t& value);
bool parse_log_level(const std::string& s, LogLevel& lvl);
std::string bytes_to_hex(const uint8_t* data, size_t len);
std::string peer_string(const std::string& host, uint16_t port);

} // namespace ferry
