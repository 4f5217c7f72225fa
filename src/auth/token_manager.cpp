#include "archon/auth/token_manager.hpp"

#include "archon/common/fs.hpp"
#include "archon/common/json_util.hpp"
#include "archon/observability/global.hpp"

#include <charconv>
#include <chrono>
#include <limits>

namespace archon::auth {

namespace {

constexpr const char *SESSION_EXPIRED_MESSAGE = "Session expired. Please login again.";

std::optional<std::int64_t> parse_i64(const std::string &raw) {
  if (raw.empty()) {
    return std::nullopt;
  }
  std::int64_t parsed = 0;
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

// Lifetimes that would overflow an epoch-millisecond deadline fall back to
// the default.
std::int64_t expires_in_secs(const common::JsonFlatMap &fields, const std::int64_t now) {
  const auto it = fields.find("expiresIn");
  if (it == fields.end()) {
    return DEFAULT_EXPIRES_IN_SECS;
  }
  const auto parsed = parse_i64(it->second);
  if (!parsed.has_value() || *parsed <= 0 ||
      *parsed > (std::numeric_limits<std::int64_t>::max() - now) / 1000) {
    return DEFAULT_EXPIRES_IN_SECS;
  }
  return *parsed;
}

// JSON null reads as absent.
std::string field_or_empty(const common::JsonFlatMap &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second == "null") {
    return {};
  }
  return it->second;
}

UserInfo parse_user(const common::JsonFlatMap &fields, const std::string &username) {
  UserInfo user{.id = 0, .username = username, .role = "VIEWER"};
  const auto it = fields.find("user");
  if (it == fields.end() || it->second.empty() || it->second.front() != '{') {
    return user;
  }
  const auto user_fields = common::json_parse_flat(it->second);
  if (const auto id = user_fields.find("id"); id != user_fields.end()) {
    user.id = parse_i64(id->second).value_or(0);
  }
  if (const auto name = field_or_empty(user_fields, "username"); !name.empty()) {
    user.username = name;
  }
  if (const auto role = field_or_empty(user_fields, "role"); !role.empty()) {
    user.role = role;
  }
  return user;
}

AuthError network_error(const http::HttpResponse &response) {
  return AuthError{.code = AuthErrorCode::NetworkError,
                   .status = 0,
                   .message = "request failed: " + response.network_error_message};
}

} // namespace

std::string_view token_state_name(const TokenState state) {
  switch (state) {
  case TokenState::NoCredentials:
    return "no_credentials";
  case TokenState::ValidToken:
    return "valid";
  case TokenState::ExpiringOrExpired:
    return "expiring";
  case TokenState::EnvOverrideActive:
    return "env_override";
  case TokenState::AutoLoginActive:
    return "auto_login";
  }
  return "unknown";
}

std::string_view token_source_name(const TokenSource source) {
  switch (source) {
  case TokenSource::None:
    return "none";
  case TokenSource::Override:
    return "override";
  case TokenSource::AutoLogin:
    return "auto_login";
  case TokenSource::Stored:
    return "stored";
  case TokenSource::Refreshed:
    return "refreshed";
  }
  return "unknown";
}

std::int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool is_token_expired(const TokenData &tokens, const std::int64_t now) {
  return tokens.expires_at < now + EXPIRY_BUFFER_MS;
}

bool is_token_expired(const TokenData &tokens) { return is_token_expired(tokens, now_ms()); }

TokenManager::TokenManager(std::shared_ptr<http::HttpClient> http, TokenStore store,
                           config::Environment env, const std::uint64_t timeout_ms)
    : http_(std::move(http)), store_(std::move(store)), env_(std::move(env)),
      timeout_ms_(timeout_ms) {}

// ── Exchanges ─────────────────────────────────────────────────────────────────

AuthResult<TokenData> TokenManager::login(const std::string &profile_key,
                                          const std::string &base_url,
                                          const std::string &username,
                                          const std::string &password, const bool insecure) {
  const http::Headers headers = {
      {"Content-Type", "application/json"},
      {"X-Auth-Mode", "token"},
  };
  const std::string body = "{\"username\":\"" + common::json_escape(username) +
                           "\",\"password\":\"" + common::json_escape(password) + "\"}";

  const auto response =
      http_->post_json(http::join_url(base_url, LOGIN_PATH), headers, body, timeout_ms_, insecure);
  if (response.network_error) {
    observability::record_login(profile_key, username, false);
    return AuthResult<TokenData>::failure(network_error(response));
  }

  const auto fields = common::json_parse_flat(common::trim(response.body));
  if (!response.ok()) {
    observability::record_login(profile_key, username, false);
    std::string message = field_or_empty(fields, "error");
    if (message.empty()) {
      message = field_or_empty(fields, "message");
    }
    if (message.empty()) {
      message = "Login failed";
    }
    return AuthResult<TokenData>::failure(AuthError{
        .code = AuthErrorCode::LoginFailed, .status = response.status, .message = message});
  }

  TokenData tokens;
  tokens.access_token = field_or_empty(fields, "accessToken");
  if (tokens.access_token.empty()) {
    observability::record_login(profile_key, username, false);
    return AuthResult<TokenData>::failure(
        AuthError{.code = AuthErrorCode::InvalidResponse,
                  .status = response.status,
                  .message = "login response missing accessToken"});
  }
  tokens.refresh_token = field_or_empty(fields, "refreshToken");
  const auto now = now_ms();
  tokens.expires_at = now + expires_in_secs(fields, now) * 1000;
  tokens.user = parse_user(fields, username);

  auto saved = store_.save(tokens, profile_key);
  if (!saved.ok()) {
    observability::record_login(profile_key, username, false);
    return AuthResult<TokenData>::failure(
        AuthError{.code = AuthErrorCode::StorageError,
                  .status = 0,
                  .message = "login succeeded but failed to save tokens: " + saved.error()});
  }

  observability::record_login(profile_key, tokens.user.username, true);
  return AuthResult<TokenData>::success(std::move(tokens));
}

AuthResult<TokenData> TokenManager::refresh(const TokenData &tokens,
                                            const std::string &profile_key,
                                            const std::string &base_url, const bool insecure) {
  const http::Headers headers = {{"Content-Type", "application/json"}};
  const std::string body =
      "{\"refreshToken\":\"" + common::json_escape(tokens.refresh_token) + "\"}";

  const auto response = http_->post_json(http::join_url(base_url, REFRESH_PATH), headers, body,
                                         timeout_ms_, insecure);
  if (response.network_error) {
    observability::record_token_refresh(profile_key, false);
    return AuthResult<TokenData>::failure(network_error(response));
  }

  if (!response.ok()) {
    observability::record_token_refresh(profile_key, false);
    auto removed = store_.remove(profile_key);
    if (!removed.ok()) {
      observability::record_error("auth", removed.error());
    }
    return AuthResult<TokenData>::failure(AuthError{.code = AuthErrorCode::RefreshFailed,
                                                    .status = response.status,
                                                    .message = SESSION_EXPIRED_MESSAGE});
  }

  const auto fields = common::json_parse_flat(common::trim(response.body));
  const std::string access_token = field_or_empty(fields, "accessToken");
  if (access_token.empty()) {
    observability::record_token_refresh(profile_key, false);
    return AuthResult<TokenData>::failure(
        AuthError{.code = AuthErrorCode::InvalidResponse,
                  .status = response.status,
                  .message = "refresh response missing accessToken"});
  }

  TokenData updated = tokens;
  updated.access_token = access_token;
  const auto now = now_ms();
  updated.expires_at = now + expires_in_secs(fields, now) * 1000;
  // The server is not obliged to rotate the refresh token.
  if (const auto rotated = field_or_empty(fields, "refreshToken"); !rotated.empty()) {
    updated.refresh_token = rotated;
  }

  auto saved = store_.save(updated, profile_key);
  if (!saved.ok()) {
    observability::record_error("auth", "failed to save refreshed tokens: " + saved.error());
  }

  observability::record_token_refresh(profile_key, true);
  return AuthResult<TokenData>::success(std::move(updated));
}

// ── Resolution ────────────────────────────────────────────────────────────────

AuthResult<TokenResolution> TokenManager::resolve(const std::string &profile_key,
                                                  const std::string &base_url,
                                                  const bool insecure) {
  auto resolved = [&](std::string token, const TokenSource source) {
    observability::record_token_resolved(profile_key, std::string(token_source_name(source)));
    return AuthResult<TokenResolution>::success(
        TokenResolution{.access_token = std::move(token), .source = source, .reason = {}});
  };
  auto no_session = [](AuthError reason) {
    return AuthResult<TokenResolution>::success(TokenResolution{
        .access_token = std::nullopt, .source = TokenSource::None, .reason = std::move(reason)});
  };

  if (env_.token_override.has_value()) {
    return resolved(*env_.token_override, TokenSource::Override);
  }

  if (env_.has_auto_login()) {
    const auto stored = store_.load(profile_key);
    if (stored.has_value() && !is_token_expired(*stored)) {
      return resolved(stored->access_token, TokenSource::Stored);
    }
    auto logged_in =
        login(profile_key, base_url, *env_.auto_login_user, *env_.auto_login_pass, insecure);
    if (!logged_in.ok()) {
      return AuthResult<TokenResolution>::failure(logged_in.error());
    }
    return resolved(logged_in.value().access_token, TokenSource::AutoLogin);
  }

  const auto stored = store_.load(profile_key);
  if (!stored.has_value()) {
    return no_session(AuthError{
        .code = AuthErrorCode::NotAuthenticated, .status = 0, .message = "Not authenticated"});
  }

  if (!is_token_expired(*stored)) {
    return resolved(stored->access_token, TokenSource::Stored);
  }

  auto refreshed = refresh(*stored, profile_key, base_url, insecure);
  if (refreshed.ok()) {
    return resolved(refreshed.value().access_token, TokenSource::Refreshed);
  }
  if (refreshed.error().code == AuthErrorCode::RefreshFailed) {
    return no_session(refreshed.error());
  }
  return no_session(AuthError{.code = AuthErrorCode::Expired,
                              .status = refreshed.error().status,
                              .message = refreshed.error().message});
}

AuthResult<std::optional<std::string>> TokenManager::get_valid_token(
    const std::string &profile_key, const std::string &base_url, const bool insecure) {
  auto resolution = resolve(profile_key, base_url, insecure);
  if (!resolution.ok()) {
    return AuthResult<std::optional<std::string>>::failure(resolution.error());
  }
  return AuthResult<std::optional<std::string>>::success(resolution.value().access_token);
}

TokenState TokenManager::quick_check(const std::string &profile_key) const {
  if (env_.has_token_override()) {
    return TokenState::EnvOverrideActive;
  }
  if (env_.has_auto_login()) {
    return TokenState::AutoLoginActive;
  }
  const auto stored = store_.load(profile_key);
  if (!stored.has_value()) {
    return TokenState::NoCredentials;
  }
  return is_token_expired(*stored) ? TokenState::ExpiringOrExpired : TokenState::ValidToken;
}

// ── Session bookkeeping ───────────────────────────────────────────────────────

bool TokenManager::is_logged_in(const std::string &profile_key) const {
  if (env_.has_token_override() || env_.has_auto_login()) {
    return true;
  }
  return store_.load(profile_key).has_value();
}

common::Result<bool> TokenManager::logout(const std::string &profile_key) {
  return store_.remove(profile_key);
}

std::optional<TokenData> TokenManager::stored_tokens(const std::string &profile_key) const {
  return store_.load(profile_key);
}

} // namespace archon::auth
