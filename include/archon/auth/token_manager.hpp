#pragma once

#include "archon/auth/error.hpp"
#include "archon/auth/token_store.hpp"
#include "archon/config/schema.hpp"
#include "archon/http/client.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace archon::auth {

// ── Constants ─────────────────────────────────────────────────────────────────

inline constexpr const char *LOGIN_PATH = "/api/auth/login";
inline constexpr const char *REFRESH_PATH = "/api/auth/refresh";

// Tokens are treated as expired this long before they actually lapse, so a
// token never runs out during the request that is about to carry it.
inline constexpr std::int64_t EXPIRY_BUFFER_MS = 5 * 60 * 1000;
inline constexpr std::int64_t DEFAULT_EXPIRES_IN_SECS = 3600;
inline constexpr std::uint64_t DEFAULT_AUTH_TIMEOUT_MS = 15000;

// ── Types ─────────────────────────────────────────────────────────────────────

enum class TokenState {
  NoCredentials,
  ValidToken,
  ExpiringOrExpired,
  EnvOverrideActive,
  AutoLoginActive,
};

enum class TokenSource {
  None,
  Override,
  AutoLogin,
  Stored,
  Refreshed,
};

struct TokenResolution {
  std::optional<std::string> access_token;
  TokenSource source = TokenSource::None;
  // Why there is no token (NotAuthenticated, Expired or RefreshFailed).
  std::optional<AuthError> reason;
};

[[nodiscard]] std::string_view token_state_name(TokenState state);
[[nodiscard]] std::string_view token_source_name(TokenSource source);

[[nodiscard]] std::int64_t now_ms();
[[nodiscard]] bool is_token_expired(const TokenData &tokens, std::int64_t now);
[[nodiscard]] bool is_token_expired(const TokenData &tokens);

// ── Manager ───────────────────────────────────────────────────────────────────

/// Produces a currently valid access token for a profile, refreshing or
/// re-authenticating as needed. At most one refresh round-trip per call.
class TokenManager {
public:
  TokenManager(std::shared_ptr<http::HttpClient> http, TokenStore store,
               config::Environment env, std::uint64_t timeout_ms = DEFAULT_AUTH_TIMEOUT_MS);

  /// Exchange credentials for a token pair and persist it under `profile_key`.
  [[nodiscard]] AuthResult<TokenData> login(const std::string &profile_key,
                                            const std::string &base_url,
                                            const std::string &username,
                                            const std::string &password, bool insecure = false);

  /// Exchange the refresh token. A rejected refresh deletes the stored record
  /// and fails with RefreshFailed.
  [[nodiscard]] AuthResult<TokenData> refresh(const TokenData &tokens,
                                              const std::string &profile_key,
                                              const std::string &base_url,
                                              bool insecure = false);

  /// Full resolution: override, then auto-login, then stored/refreshed token.
  /// Fails only when an auto-login exchange fails; "no session" is a success
  /// with an empty token and a reason.
  [[nodiscard]] AuthResult<TokenResolution> resolve(const std::string &profile_key,
                                                    const std::string &base_url,
                                                    bool insecure = false);

  [[nodiscard]] AuthResult<std::optional<std::string>>
  get_valid_token(const std::string &profile_key, const std::string &base_url,
                  bool insecure = false);

  /// No-network classification of the profile's credentials.
  [[nodiscard]] TokenState quick_check(const std::string &profile_key) const;

  [[nodiscard]] bool is_logged_in(const std::string &profile_key) const;
  [[nodiscard]] common::Result<bool> logout(const std::string &profile_key);
  [[nodiscard]] std::optional<TokenData> stored_tokens(const std::string &profile_key) const;

  [[nodiscard]] const TokenStore &store() const { return store_; }
  [[nodiscard]] const config::Environment &environment() const { return env_; }

private:
  std::shared_ptr<http::HttpClient> http_;
  TokenStore store_;
  config::Environment env_;
  std::uint64_t timeout_ms_;
};

} // namespace archon::auth
