#pragma once

#include <string>
#include <unordered_map>

namespace archon::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// True when `text` is exactly one well-formed JSON object, surrounding
/// whitespace aside.
[[nodiscard]] bool json_is_object(const std::string &text);

/// Parse the top level of a JSON object into a key→value map. String values are
/// unescaped; objects, arrays, numbers and literals are kept as raw text.
/// Anything that is not an object yields an empty map.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

} // namespace archon::common
