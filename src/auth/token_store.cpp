#include "archon/auth/token_store.hpp"

#include "archon/common/fs.hpp"
#include "archon/common/json_util.hpp"
#include "archon/config/config.hpp"

#include <charconv>
#include <sstream>

namespace archon::auth {

namespace {

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

} // namespace

std::string serialize_token_data(const TokenData &tokens) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"accessToken\": \"" << common::json_escape(tokens.access_token) << "\",\n";
  out << "  \"refreshToken\": \"" << common::json_escape(tokens.refresh_token) << "\",\n";
  out << "  \"expiresAt\": " << tokens.expires_at << ",\n";
  out << "  \"user\": {\n";
  out << "    \"id\": " << tokens.user.id << ",\n";
  out << "    \"username\": \"" << common::json_escape(tokens.user.username) << "\",\n";
  out << "    \"role\": \"" << common::json_escape(tokens.user.role) << "\"\n";
  out << "  }\n";
  out << "}\n";
  return out.str();
}

std::optional<TokenData> parse_token_data(const std::string &json) {
  const std::string text = common::trim(json);
  if (!common::json_is_object(text)) {
    return std::nullopt;
  }

  const auto fields = common::json_parse_flat(text);
  const auto access = fields.find("accessToken");
  const auto expires = fields.find("expiresAt");
  if (access == fields.end() || access->second.empty() || expires == fields.end()) {
    return std::nullopt;
  }
  const auto expires_at = parse_i64(expires->second);
  if (!expires_at.has_value()) {
    return std::nullopt;
  }

  TokenData tokens;
  tokens.access_token = access->second;
  tokens.expires_at = *expires_at;
  if (const auto refresh = fields.find("refreshToken"); refresh != fields.end()) {
    tokens.refresh_token = refresh->second;
  }

  if (const auto user = fields.find("user");
      user != fields.end() && common::json_is_object(user->second)) {
    const auto user_fields = common::json_parse_flat(user->second);
    if (const auto id = user_fields.find("id"); id != user_fields.end()) {
      tokens.user.id = parse_i64(id->second).value_or(0);
    }
    if (const auto name = user_fields.find("username"); name != user_fields.end()) {
      tokens.user.username = name->second;
    }
    if (const auto role = user_fields.find("role"); role != user_fields.end()) {
      tokens.user.role = role->second;
    }
  }

  return tokens;
}

TokenStore::TokenStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

common::Result<std::filesystem::path> TokenStore::path_for(const std::string &profile_key) const {
  if (!config::is_valid_profile_key(profile_key)) {
    return common::Result<std::filesystem::path>::failure("invalid profile key '" + profile_key +
                                                          "'");
  }
  return common::Result<std::filesystem::path>::success(directory_ / (profile_key + ".json"));
}

std::optional<TokenData> TokenStore::load(const std::string &profile_key) const {
  const auto path = path_for(profile_key);
  if (!path.ok()) {
    return std::nullopt;
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path.value(), ec)) {
    return std::nullopt;
  }

  auto content = common::read_file(path.value());
  if (!content.ok()) {
    return std::nullopt;
  }
  return parse_token_data(content.value());
}

common::Status TokenStore::save(const TokenData &tokens, const std::string &profile_key) const {
  const auto path = path_for(profile_key);
  if (!path.ok()) {
    return common::Status::error(path.error());
  }
  return common::write_file_atomic(path.value(), serialize_token_data(tokens), true);
}

common::Result<bool> TokenStore::remove(const std::string &profile_key) const {
  const auto path = path_for(profile_key);
  if (!path.ok()) {
    return common::Result<bool>::failure(path.error());
  }

  std::error_code ec;
  const bool removed = std::filesystem::remove(path.value(), ec);
  if (ec) {
    return common::Result<bool>::failure("failed to remove " + path.value().string() + ": " +
                                         ec.message());
  }
  return common::Result<bool>::success(removed);
}

} // namespace archon::auth
