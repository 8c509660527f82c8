#include "destination.hpp"

namespace fs = std::filesystem;

namespace ferry {

std::string sanitize_file_name(const std::string &name) {
  std::string n = name;
  for (auto &c : n)
    if (c == '\\')
      c = '/';
  while (!n.empty() && n.back() == '/')
    n.pop_back();
  auto base = fs::path(n).filename().string();
  if (base.empty() || base == "." || base == "..")
    return {};
  return base;
}

// Symlinks, dangling ones included, count as taken.
static bool name_is_free(const fs::path &p, std::error_code &ec) {
  auto st = fs::symlink_status(p, ec);
  if (st.type() == fs::file_type::not_found) {
    ec.clear();
    return true;
  }
  return false;
}

fs::path resolve_destination(const fs::path &dir, const std::string &name) {
  std::error_code ec;
  fs::path candidate = dir / name;
  if (name_is_free(candidate, ec))
    return candidate;
  if (ec)
    return {};
  fs::path base(name);
  std::string stem = base.stem().string();
  std::string ext = base.extension().string();
  for (unsigned long i = 1;; i++) {
    candidate = dir / (stem + "_" + std::to_string(i) + ext);
    if (name_is_free(candidate, ec))
      return candidate;
    if (ec)
      return {};
  }
}

} // namespace ferry
