#pragma once

#include "archon/common/result.hpp"

#include <filesystem>
#include <string>

namespace archon::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write via `<path>.tmp` + rename so readers never observe a partial file.
/// With `owner_only` the file is chmod'ed 0600 before it becomes visible.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content, bool owner_only = false);

} // namespace archon::common
