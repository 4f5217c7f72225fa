#pragma once

#include "archon/common/result.hpp"
#include "archon/config/schema.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace archon::config {

/// Named server profiles persisted in config.toml, plus resolution of the
/// profile a command should target.
///
/// Active profile precedence: the session override for this invocation, then
/// ARCHON_PROFILE, then the persisted default.
class ProfileStore {
public:
  ProfileStore(std::filesystem::path config_file, Environment env);

  [[nodiscard]] common::Result<Config> load_config() const;
  [[nodiscard]] common::Status save_config(const Config &config) const;

  [[nodiscard]] common::Result<std::map<std::string, Profile>> profiles() const;
  [[nodiscard]] common::Result<Profile> find(const std::string &key) const;

  /// Create or overwrite.
  [[nodiscard]] common::Status set_profile(const std::string &key, Profile profile) const;

  /// Returns false when the key was unknown. Removing the persisted default
  /// moves the default to the first remaining key, or to "production".
  [[nodiscard]] common::Result<bool> delete_profile(const std::string &key) const;

  [[nodiscard]] common::Status set_default_profile(const std::string &key) const;

  /// In-memory only; never written to disk.
  [[nodiscard]] common::Status set_session_profile(const std::string &key);
  void clear_session_profile() { session_profile_.reset(); }

  [[nodiscard]] common::Result<std::string> active_profile_name() const;

  /// The resolved profile with ARCHON_URL applied to its URL. The key is never
  /// affected by the URL override.
  [[nodiscard]] common::Result<Profile> active_profile() const;

  [[nodiscard]] const std::filesystem::path &config_file() const { return config_file_; }

private:
  std::filesystem::path config_file_;
  Environment env_;
  std::optional<std::string> session_profile_;
};

} // namespace archon::config
