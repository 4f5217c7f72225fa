#pragma once

#include "archon/common/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace archon::auth {

enum class AuthErrorCode {
  // No credentials of any kind for the profile.
  NotAuthenticated,
  // Stored token past its buffer and the refresh could not be completed.
  Expired,
  // Server rejected the refresh token; the local record has been purged.
  RefreshFailed,
  // Server rejected the username/password.
  LoginFailed,
  NetworkError,
  InvalidResponse,
  StorageError,
};

struct AuthError {
  AuthErrorCode code = AuthErrorCode::NotAuthenticated;
  std::uint16_t status = 0;
  std::string message;

  [[nodiscard]] std::string to_string() const;

  /// One-line hint telling the user what to run next.
  [[nodiscard]] std::string remediation() const;
};

[[nodiscard]] std::string_view auth_error_code_name(AuthErrorCode code);

template <typename T> using AuthResult = common::Result<T, AuthError>;

} // namespace archon::auth
