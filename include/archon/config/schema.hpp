#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace archon::config {

struct Profile {
  std::string key;
  std::string name; // display name
  std::string url;
  bool insecure = false;
};

struct HttpConfig {
  std::uint64_t timeout_ms = 30000;
  // Bound on login and refresh exchanges.
  std::uint64_t auth_timeout_ms = 15000;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  std::string default_profile = "production";
  std::map<std::string, Profile> profiles;
  HttpConfig http;
  ObservabilityConfig observability;
};

/// Environment inputs, captured once per process so business logic never calls
/// getenv. Empty variables are treated as unset.
struct Environment {
  std::optional<std::string> token_override;  // ARCHON_TOKEN
  std::optional<std::string> auto_login_user; // ARCHON_USER
  std::optional<std::string> auto_login_pass; // ARCHON_PASS
  std::optional<std::string> profile_override; // ARCHON_PROFILE
  std::optional<std::string> url_override;     // ARCHON_URL
  std::optional<std::filesystem::path> config_dir; // ARCHON_CONFIG_DIR
  bool debug = false;                              // ARCHON_DEBUG

  [[nodiscard]] bool has_token_override() const { return token_override.has_value(); }
  [[nodiscard]] bool has_auto_login() const {
    return auto_login_user.has_value() && auto_login_pass.has_value();
  }
};

} // namespace archon::config
