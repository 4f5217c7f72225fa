#include "archon/auth/error.hpp"

#include <sstream>

namespace archon::auth {

std::string_view auth_error_code_name(const AuthErrorCode code) {
  switch (code) {
  case AuthErrorCode::NotAuthenticated:
    return "not_authenticated";
  case AuthErrorCode::Expired:
    return "expired";
  case AuthErrorCode::RefreshFailed:
    return "refresh_failed";
  case AuthErrorCode::LoginFailed:
    return "login_failed";
  case AuthErrorCode::NetworkError:
    return "network";
  case AuthErrorCode::InvalidResponse:
    return "invalid_response";
  case AuthErrorCode::StorageError:
    return "storage";
  }
  return "unknown";
}

std::string AuthError::to_string() const {
  std::ostringstream stream;
  stream << "Auth error [" << auth_error_code_name(code) << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

std::string AuthError::remediation() const {
  switch (code) {
  case AuthErrorCode::NotAuthenticated:
  case AuthErrorCode::Expired:
  case AuthErrorCode::RefreshFailed:
    return "Run: archon auth login";
  case AuthErrorCode::LoginFailed:
    return "Check the username and password (or ARCHON_USER / ARCHON_PASS) and try again.";
  case AuthErrorCode::NetworkError:
    return "Check the profile URL and your network connection.";
  case AuthErrorCode::InvalidResponse:
    return "The server returned an unexpected response; check the profile URL.";
  case AuthErrorCode::StorageError:
    return "Check permissions on the archon config directory.";
  }
  return "";
}

} // namespace archon::auth
