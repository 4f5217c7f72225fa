#pragma once

#include "archon/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace archon::common {

/// A decoded scalar. String escapes are already resolved; integers and booleans
/// keep their literal text.
struct TomlValue {
  enum class Kind { String, Boolean, Integer };

  Kind kind = Kind::String;
  std::string text;
};

/// The subset of TOML used by config.toml: `[a.b]` tables and `key = scalar`
/// pairs, addressed by dotted key ("profiles.local.url").
struct TomlDocument {
  std::map<std::string, TomlValue> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;

  /// Names of the direct child tables of `prefix`, e.g. "profiles" yields
  /// {"local", "production"} for `[profiles.local]` and `[profiles.production]`.
  [[nodiscard]] std::vector<std::string> child_tables(const std::string &prefix) const;
};

/// Fails with "line N: <reason>" on the first malformed line.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace archon::common
