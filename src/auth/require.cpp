#include "archon/auth/require.hpp"

namespace archon::auth {

AuthResult<std::string> require_auth(TokenManager &manager, const config::Profile &profile,
                                     std::ostream &notices) {
  const auto state = manager.quick_check(profile.key);
  if (state == TokenState::NoCredentials) {
    return AuthResult<std::string>::failure(AuthError{
        .code = AuthErrorCode::NotAuthenticated, .status = 0, .message = "Not authenticated"});
  }
  if (state == TokenState::ExpiringOrExpired) {
    notices << "Session expired, refreshing...\n";
  }

  auto resolution = manager.resolve(profile.key, profile.url, profile.insecure);
  if (!resolution.ok()) {
    return AuthResult<std::string>::failure(resolution.error());
  }
  const auto &resolved = resolution.value();
  if (resolved.access_token.has_value()) {
    return AuthResult<std::string>::success(*resolved.access_token);
  }

  if (resolved.reason.has_value() && resolved.reason->code != AuthErrorCode::NotAuthenticated) {
    return AuthResult<std::string>::failure(*resolved.reason);
  }
  return AuthResult<std::string>::failure(AuthError{
      .code = AuthErrorCode::NotAuthenticated, .status = 0, .message = "Not authenticated"});
}

} // namespace archon::auth
