#pragma once
#include <string>
#include <system_error>

namespace ferry {

enum class Errc {
    ok = 0,
    connection_error = 1,
    bind_error,
    file_access_error,
    malformed_header,
    truncated_stream,
    checksum_mismatch
};

const std::error_category& transfer_category();
std::error_code make_error_code(Errc e);

} // namespace ferry

namespace std {
template <> struct is_error_code_enum<ferry::Errc> : true_type {};
} // namespace std
