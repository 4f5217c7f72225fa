#include "archon/auth/claims.hpp"

#include "archon/common/fs.hpp"
#include "archon/common/json_util.hpp"

#include <openssl/evp.h>

#include <charconv>
#include <limits>
#include <vector>

namespace archon::auth {

namespace {

common::Result<std::string, ClaimDecodeError> b64url_decode(std::string text) {
  for (char &ch : text) {
    if (ch == '-') {
      ch = '+';
    } else if (ch == '_') {
      ch = '/';
    }
  }
  if (text.size() % 4 == 1) {
    return common::Result<std::string, ClaimDecodeError>::failure({"bad base64url length"});
  }
  std::size_t padding = 0;
  while (text.size() % 4 != 0) {
    text.push_back('=');
    ++padding;
  }
  if (padding == 0 && !text.empty() && text.back() == '=') {
    ++padding;
    if (text.size() > 1 && text[text.size() - 2] == '=') {
      ++padding;
    }
  }

  std::vector<unsigned char> decoded(text.size());
  const int len =
      EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char *>(text.data()),
                      static_cast<int>(text.size()));
  if (len < 0 || static_cast<std::size_t>(len) < padding) {
    return common::Result<std::string, ClaimDecodeError>::failure({"invalid base64url payload"});
  }
  return common::Result<std::string, ClaimDecodeError>::success(
      std::string(decoded.begin(), decoded.begin() + (len - static_cast<int>(padding))));
}

std::optional<std::int64_t> parse_seconds(const std::string &raw) {
  std::int64_t parsed = 0;
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr == first) {
    return std::nullopt;
  }
  // A fractional part is truncated; exponents and trailing text are rejected.
  if (ptr != last) {
    if (*ptr != '.' || ptr + 1 == last) {
      return std::nullopt;
    }
    for (const auto *digit = ptr + 1; digit != last; ++digit) {
      if (*digit < '0' || *digit > '9') {
        return std::nullopt;
      }
    }
  }
  return parsed;
}

} // namespace

ClaimsResult decode_display_claims(const std::string &token) {
  const auto first_dot = token.find('.');
  if (first_dot == std::string::npos) {
    return ClaimsResult::failure({"token is not a JWT"});
  }
  const auto second_dot = token.find('.', first_dot + 1);
  if (second_dot == std::string::npos) {
    return ClaimsResult::failure({"token is not a JWT"});
  }

  const std::string segment = token.substr(first_dot + 1, second_dot - first_dot - 1);
  if (segment.empty()) {
    return ClaimsResult::failure({"empty payload"});
  }

  auto payload = b64url_decode(segment);
  if (!payload.ok()) {
    return ClaimsResult::failure(payload.error());
  }

  const std::string json = common::trim(payload.value());
  if (!common::json_is_object(json)) {
    return ClaimsResult::failure({"payload is not a JSON object"});
  }

  const auto fields = common::json_parse_flat(json);
  DisplayClaims claims;
  if (const auto it = fields.find("sub"); it != fields.end()) {
    claims.subject = it->second;
  }
  if (const auto it = fields.find("username"); it != fields.end()) {
    claims.username = it->second;
  }
  if (const auto it = fields.find("role"); it != fields.end()) {
    claims.role = it->second;
  }
  if (const auto it = fields.find("exp"); it != fields.end()) {
    constexpr auto max_seconds = std::numeric_limits<std::int64_t>::max() / 1000;
    constexpr auto min_seconds = std::numeric_limits<std::int64_t>::min() / 1000;
    if (auto seconds = parse_seconds(it->second);
        seconds.has_value() && *seconds <= max_seconds && *seconds >= min_seconds) {
      claims.expires_at_ms = *seconds * 1000;
    }
  }
  return ClaimsResult::success(std::move(claims));
}

} // namespace archon::auth
