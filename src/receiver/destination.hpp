#pragma once
#include <filesystem>
#include <string>

namespace ferry {

// Reduces a sender-supplied name to its last path component. Returns an
// empty string when nothing usable remains ("", ".", "..").
std::string sanitize_file_name(const std::string& name);

// First path in dir named name, name_1.ext, name_2.ext, ... that does not
// exist yet, symlinks included. The suffix goes before the last extension.
// Returns an empty path when a candidate cannot be examined.
std::filesystem::path resolve_destination(const std::filesystem::path& dir,
                                          const std::string& name);

} // namespace ferry
