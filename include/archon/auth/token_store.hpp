#pragma once

#include "archon/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace archon::auth {

struct UserInfo {
  std::int64_t id = 0;
  std::string username;
  std::string role;

  bool operator==(const UserInfo &) const = default;
};

struct TokenData {
  std::string access_token;
  std::string refresh_token;
  std::int64_t expires_at = 0; // epoch milliseconds
  UserInfo user;

  bool operator==(const TokenData &) const = default;
};

[[nodiscard]] std::string serialize_token_data(const TokenData &tokens);

/// Returns nullopt for anything that is not a complete record.
[[nodiscard]] std::optional<TokenData> parse_token_data(const std::string &json);

/// One JSON record per profile key under a single directory. Keys are
/// validated before they touch the filesystem, so one profile can never
/// address another profile's file.
class TokenStore {
public:
  explicit TokenStore(std::filesystem::path directory);

  /// Missing, unreadable and corrupted records all load as nullopt.
  [[nodiscard]] std::optional<TokenData> load(const std::string &profile_key) const;

  /// Creates the directory on demand; the record is written 0600.
  [[nodiscard]] common::Status save(const TokenData &tokens, const std::string &profile_key) const;

  /// True iff a record existed and was removed.
  [[nodiscard]] common::Result<bool> remove(const std::string &profile_key) const;

  [[nodiscard]] common::Result<std::filesystem::path>
  path_for(const std::string &profile_key) const;

  [[nodiscard]] const std::filesystem::path &directory() const { return directory_; }

private:
  std::filesystem::path directory_;
};

} // namespace archon::auth
