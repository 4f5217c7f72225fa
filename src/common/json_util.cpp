#include "archon/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>

namespace archon::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

// Single-pass reader over a JSON text. Every read_* method leaves the cursor
// just past what it consumed and returns nullopt/false on malformed input.
class Scanner {
public:
  explicit Scanner(const std::string &text) : text_(text) {}

  void skip_ws() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  [[nodiscard]] bool at_end() const { return pos_ >= text_.size(); }
  [[nodiscard]] char peek() const { return at_end() ? '\0' : text_[pos_]; }

  bool consume(const char ch) {
    if (peek() != ch) {
      return false;
    }
    ++pos_;
    return true;
  }

  std::optional<std::string> read_string() {
    if (!consume('"')) {
      return std::nullopt;
    }
    std::string out;
    while (!at_end()) {
      const char ch = text_[pos_++];
      if (ch == '"') {
        return out;
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (at_end()) {
        return std::nullopt;
      }
      const char esc = text_[pos_++];
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u': {
        auto unit = read_hex4();
        if (!unit.has_value()) {
          return std::nullopt;
        }
        std::uint32_t code_point = *unit;
        if (code_point >= 0xD800 && code_point <= 0xDBFF && text_.compare(pos_, 2, "\\u") == 0) {
          const auto high_end = pos_;
          pos_ += 2;
          auto low = read_hex4();
          if (!low.has_value()) {
            return std::nullopt;
          }
          if (*low >= 0xDC00 && *low <= 0xDFFF) {
            code_point = 0x10000 + ((code_point - 0xD800) << 10) + (*low - 0xDC00);
          } else {
            // Not a pair; the second escape is decoded on its own.
            pos_ = high_end;
          }
        }
        // Unpaired surrogates become U+FFFD.
        if (code_point >= 0xD800 && code_point <= 0xDFFF) {
          code_point = 0xFFFD;
        }
        append_utf8(out, code_point);
        break;
      }
      default:
        return std::nullopt;
      }
    }
    return std::nullopt;
  }

  // Skips any value and returns its raw text.
  std::optional<std::string> read_raw_value() {
    const auto start = pos_;
    if (!skip_value()) {
      return std::nullopt;
    }
    return text_.substr(start, pos_ - start);
  }

  bool skip_value() {
    switch (peek()) {
    case '"':
      return read_string().has_value();
    case '{':
      return skip_container('{', '}', true);
    case '[':
      return skip_container('[', ']', false);
    default:
      return skip_scalar();
    }
  }

private:
  std::optional<std::uint32_t> read_hex4() {
    if (pos_ + 4 > text_.size()) {
      return std::nullopt;
    }
    std::uint32_t value = 0;
    const auto *first = text_.data() + pos_;
    auto [ptr, ec] = std::from_chars(first, first + 4, value, 16);
    if (ec != std::errc() || ptr != first + 4) {
      return std::nullopt;
    }
    pos_ += 4;
    return value;
  }

  bool skip_container(const char open, const char close, const bool keyed) {
    consume(open);
    skip_ws();
    if (consume(close)) {
      return true;
    }
    while (!at_end()) {
      if (keyed) {
        if (!read_string().has_value()) {
          return false;
        }
        skip_ws();
        if (!consume(':')) {
          return false;
        }
        skip_ws();
      }
      if (!skip_value()) {
        return false;
      }
      skip_ws();
      if (consume(close)) {
        return true;
      }
      if (!consume(',')) {
        return false;
      }
      skip_ws();
    }
    return false;
  }

  bool skip_scalar() {
    const auto start = pos_;
    while (!at_end()) {
      const char ch = text_[pos_];
      if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '-' && ch != '+' &&
          ch != '.') {
        break;
      }
      ++pos_;
    }
    return pos_ > start;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

} // namespace

std::string json_escape(const std::string &value) {
  static constexpr char HEX[] = "0123456789abcdef";
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        escaped += "\\u00";
        escaped.push_back(HEX[(ch >> 4) & 0x0F]);
        escaped.push_back(HEX[ch & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

bool json_is_object(const std::string &text) {
  Scanner scanner(text);
  scanner.skip_ws();
  if (scanner.peek() != '{' || !scanner.skip_value()) {
    return false;
  }
  scanner.skip_ws();
  return scanner.at_end();
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  Scanner scanner(json);
  scanner.skip_ws();
  if (!scanner.consume('{')) {
    return result;
  }

  scanner.skip_ws();
  while (!scanner.at_end() && !scanner.consume('}')) {
    auto key = scanner.read_string();
    if (!key.has_value()) {
      break;
    }
    scanner.skip_ws();
    if (!scanner.consume(':')) {
      break;
    }
    scanner.skip_ws();

    std::optional<std::string> value;
    if (scanner.peek() == '"') {
      value = scanner.read_string();
    } else {
      value = scanner.read_raw_value();
    }
    if (!value.has_value()) {
      break;
    }
    result[*key] = std::move(*value);

    scanner.skip_ws();
    scanner.consume(',');
    scanner.skip_ws();
  }
  return result;
}

} // namespace archon::common
