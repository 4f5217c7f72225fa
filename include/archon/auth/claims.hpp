#pragma once

#include "archon/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace archon::auth {

/// Unverified view of an access token's payload, for presentation only.
/// Nothing in the token lifecycle accepts this type; expiry and validity are
/// decided by the stored record and the server.
struct DisplayClaims {
  std::string subject;
  std::string username;
  std::string role;
  std::optional<std::int64_t> expires_at_ms;
};

struct ClaimDecodeError {
  std::string reason;

  [[nodiscard]] std::string to_string() const { return "claim decode failed: " + reason; }
};

using ClaimsResult = common::Result<DisplayClaims, ClaimDecodeError>;

/// Best-effort decode of a JWT payload segment. Signatures are not checked.
[[nodiscard]] ClaimsResult decode_display_claims(const std::string &token);

} // namespace archon::auth
