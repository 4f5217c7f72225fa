#pragma once

#include "archon/api/client.hpp"
#include "archon/auth/error.hpp"
#include "archon/auth/token_manager.hpp"
#include "archon/common/result.hpp"
#include "archon/config/profiles.hpp"
#include "archon/config/schema.hpp"
#include "archon/http/client.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace archon::runtime {

struct SessionOptions {
  std::optional<std::string> profile_override;     // --profile
  std::optional<std::filesystem::path> config_dir; // --config
};

/// Everything one command invocation needs: the environment snapshot, the
/// profile store, the token manager and the shared HTTP transport.
class Session {
public:
  /// Loads (and on first run seeds) the config and installs the global
  /// observer. A null `http` selects the libcurl transport.
  [[nodiscard]] static common::Result<Session>
  create(const SessionOptions &options, config::Environment env,
         std::shared_ptr<http::HttpClient> http = nullptr);

  [[nodiscard]] config::ProfileStore &profiles() { return profiles_; }
  [[nodiscard]] const config::ProfileStore &profiles() const { return profiles_; }
  [[nodiscard]] auth::TokenManager &tokens() { return tokens_; }
  [[nodiscard]] const config::Environment &environment() const { return env_; }
  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] const std::filesystem::path &config_dir() const { return config_dir_; }
  [[nodiscard]] const std::shared_ptr<http::HttpClient> &http() const { return http_; }

  [[nodiscard]] common::Result<config::Profile> active_profile() const;

  /// Client carrying a token produced by `auth::require_auth`.
  [[nodiscard]] auth::AuthResult<api::ApiClient>
  authenticated_client(const config::Profile &profile, std::ostream &notices);

  [[nodiscard]] api::ApiClient anonymous_client(const config::Profile &profile) const;

private:
  Session(config::Environment env, config::Config config, std::filesystem::path config_dir,
          std::shared_ptr<http::HttpClient> http);

  config::Environment env_;
  config::Config config_;
  std::filesystem::path config_dir_;
  std::shared_ptr<http::HttpClient> http_;
  config::ProfileStore profiles_;
  auth::TokenManager tokens_;
};

} // namespace archon::runtime
