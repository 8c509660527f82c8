#include "errors.hpp"

namespace ferry {

namespace {

class TransferCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "ferry"; }

  std::string message(int ev) const override {
    switch (static_cast<Errc>(ev)) {
    case Errc::ok:
      return "success";
    case Errc::connection_error:
      return "connection error";
    case Errc::bind_error:
      return "bind error";
    case Errc::file_access_error:
      return "file access error";
    case Errc::malformed_header:
      return "malformed header";
    case Errc::truncated_stream:
      return "truncated stream";
    case Errc::checksum_mismatch:
      return "checksum mismatch";
    }
    return "unknown error";
  }
};

} // namespace

const std::error_category &transfer_category() {
  static TransferCategory cat;
  return cat;
}

std::error_code make_error_code(Errc e) {
  return {static_cast<int>(e), transfer_category()};
}

} // namespace ferry
