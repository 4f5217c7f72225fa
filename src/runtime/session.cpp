#include "archon/runtime/session.hpp"

#include "archon/auth/require.hpp"
#include "archon/config/config.hpp"
#include "archon/observability/factory.hpp"
#include "archon/observability/global.hpp"

namespace archon::runtime {

Session::Session(config::Environment env, config::Config config,
                 std::filesystem::path config_dir, std::shared_ptr<http::HttpClient> http)
    : env_(std::move(env)), config_(std::move(config)), config_dir_(std::move(config_dir)),
      http_(std::move(http)), profiles_(config::config_path(config_dir_), env_),
      tokens_(http_, auth::TokenStore(config::tokens_dir(config_dir_)), env_,
              config_.http.auth_timeout_ms) {}

common::Result<Session> Session::create(const SessionOptions &options, config::Environment env,
                                        std::shared_ptr<http::HttpClient> http) {
  if (options.config_dir.has_value()) {
    env.config_dir = *options.config_dir;
  }

  auto dir = config::config_dir(env);
  if (!dir.ok()) {
    return common::Result<Session>::failure(dir.error());
  }

  auto loaded = config::load_config(config::config_path(dir.value()));
  if (!loaded.ok()) {
    return common::Result<Session>::failure(loaded.error());
  }

  const std::string backend = env.debug ? "log" : loaded.value().observability.backend;
  auto observer = observability::create_observer(backend, config::log_path(dir.value()));
  if (!observer.ok()) {
    return common::Result<Session>::failure("Invalid config: " + observer.error());
  }
  observability::set_global_observer(std::move(observer.value()));

  if (http == nullptr) {
    http = std::make_shared<http::CurlHttpClient>();
  }

  Session session(std::move(env), std::move(loaded.value()), std::move(dir.value()),
                  std::move(http));
  if (options.profile_override.has_value()) {
    auto selected = session.profiles_.set_session_profile(*options.profile_override);
    if (!selected.ok()) {
      return common::Result<Session>::failure(selected.error());
    }
  }
  return common::Result<Session>::success(std::move(session));
}

common::Result<config::Profile> Session::active_profile() const {
  return profiles_.active_profile();
}

auth::AuthResult<api::ApiClient> Session::authenticated_client(const config::Profile &profile,
                                                               std::ostream &notices) {
  auto token = auth::require_auth(tokens_, profile, notices);
  if (!token.ok()) {
    return auth::AuthResult<api::ApiClient>::failure(token.error());
  }
  return auth::AuthResult<api::ApiClient>::success(api::ApiClient(
      http_, profile.url, token.value(), profile.insecure, config_.http.timeout_ms));
}

api::ApiClient Session::anonymous_client(const config::Profile &profile) const {
  return api::ApiClient(http_, profile.url, std::nullopt, profile.insecure,
                        config_.http.timeout_ms);
}

} // namespace archon::runtime
