#pragma once

#include "archon/common/result.hpp"
#include "archon/config/schema.hpp"

#include <filesystem>
#include <string>

namespace archon::config {

inline constexpr const char *DEFAULT_PROFILE_KEY = "production";

/// Read dotenv files (`$ARCHON_ENV_FILE`, then `<config dir>/.env`) into the
/// process environment without overwriting, then snapshot the ARCHON_* inputs.
[[nodiscard]] Environment load_environment();

/// `$ARCHON_CONFIG_DIR` (or the snapshot's override), else `$HOME/.archon`.
/// The directory is created if missing.
[[nodiscard]] common::Result<std::filesystem::path> config_dir(const Environment &env);
[[nodiscard]] std::filesystem::path config_path(const std::filesystem::path &dir);
[[nodiscard]] std::filesystem::path tokens_dir(const std::filesystem::path &dir);
[[nodiscard]] std::filesystem::path log_path(const std::filesystem::path &dir);

[[nodiscard]] bool is_valid_profile_key(const std::string &key);
[[nodiscard]] bool is_valid_profile_url(const std::string &url);

[[nodiscard]] Config default_config();

/// Loads the TOML config at `path`. When the file does not exist yet the
/// default profiles are seeded and written out.
[[nodiscard]] common::Result<Config> load_config(const std::filesystem::path &path);
[[nodiscard]] common::Status save_config(const Config &config, const std::filesystem::path &path);

} // namespace archon::config
