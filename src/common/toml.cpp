#include "archon/common/toml.hpp"

#include "archon/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <set>
#include <sstream>

namespace archon::common {

namespace {

bool is_bare_key_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-' || ch == '.';
}

bool is_bare_key(const std::string &key) {
  if (key.empty() || key.front() == '.' || key.back() == '.' ||
      key.find("..") != std::string::npos) {
    return false;
  }
  for (const char ch : key) {
    if (!is_bare_key_char(ch)) {
      return false;
    }
  }
  return true;
}

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

// Reads one value starting at `pos` and checks that only a comment follows.
class ValueReader {
public:
  explicit ValueReader(const std::string &text) : text_(text) {}

  Result<TomlValue> read() {
    pos_ = skip_blank(0);
    if (pos_ >= text_.size()) {
      return Result<TomlValue>::failure("missing value");
    }

    Result<TomlValue> value = Result<TomlValue>::failure("unsupported value");
    if (text_[pos_] == '"') {
      value = read_basic_string();
    } else if (text_[pos_] == '\'') {
      value = read_literal_string();
    } else {
      value = read_bare_scalar();
    }
    if (!value.ok()) {
      return value;
    }

    const auto rest = skip_blank(pos_);
    if (rest < text_.size() && text_[rest] != '#') {
      return Result<TomlValue>::failure("unexpected text after value");
    }
    return value;
  }

private:
  std::size_t skip_blank(std::size_t pos) const {
    while (pos < text_.size() && (text_[pos] == ' ' || text_[pos] == '\t')) {
      ++pos;
    }
    return pos;
  }

  Result<TomlValue> read_basic_string() {
    std::string out;
    for (++pos_; pos_ < text_.size(); ++pos_) {
      const char ch = text_[pos_];
      if (ch == '"') {
        ++pos_;
        return Result<TomlValue>::success(
            TomlValue{.kind = TomlValue::Kind::String, .text = std::move(out)});
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (++pos_ >= text_.size()) {
        break;
      }
      switch (text_[pos_]) {
      case '"':
        out.push_back('"');
        break;
      case '\\':
        out.push_back('\\');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 'u': {
        if (pos_ + 4 >= text_.size()) {
          return Result<TomlValue>::failure("truncated \\u escape");
        }
        std::uint32_t code_point = 0;
        const auto *first = text_.data() + pos_ + 1;
        auto [ptr, ec] = std::from_chars(first, first + 4, code_point, 16);
        if (ec != std::errc() || ptr != first + 4) {
          return Result<TomlValue>::failure("invalid \\u escape");
        }
        append_utf8(out, code_point);
        pos_ += 4;
        break;
      }
      default:
        return Result<TomlValue>::failure(std::string("unknown escape \\") + text_[pos_]);
      }
    }
    return Result<TomlValue>::failure("unterminated string");
  }

  Result<TomlValue> read_literal_string() {
    const auto close = text_.find('\'', pos_ + 1);
    if (close == std::string::npos) {
      return Result<TomlValue>::failure("unterminated string");
    }
    TomlValue value{.kind = TomlValue::Kind::String,
                    .text = text_.substr(pos_ + 1, close - pos_ - 1)};
    pos_ = close + 1;
    return Result<TomlValue>::success(std::move(value));
  }

  Result<TomlValue> read_bare_scalar() {
    const auto start = pos_;
    while (pos_ < text_.size() && text_[pos_] != ' ' && text_[pos_] != '\t' &&
           text_[pos_] != '#') {
      ++pos_;
    }
    const std::string token = text_.substr(start, pos_ - start);
    if (token == "true" || token == "false") {
      return Result<TomlValue>::success(
          TomlValue{.kind = TomlValue::Kind::Boolean, .text = token});
    }

    std::string digits;
    for (const char ch : token) {
      if (ch != '_') {
        digits.push_back(ch);
      }
    }
    std::int64_t parsed = 0;
    const auto *first = digits.data();
    const auto *last = first + digits.size();
    if (!digits.empty() && digits.front() == '+') {
      ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (digits.empty() || ec != std::errc() || ptr != last) {
      return Result<TomlValue>::failure("unsupported value '" + token + "'");
    }
    return Result<TomlValue>::success(
        TomlValue{.kind = TomlValue::Kind::Integer, .text = std::to_string(parsed)});
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlValue::Kind::String) {
    return fallback;
  }
  return it->second.text;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlValue::Kind::Boolean) {
    return fallback;
  }
  return it->second.text == "true";
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlValue::Kind::Integer) {
    return fallback;
  }
  std::uint64_t parsed = 0;
  const auto &text = it->second.text;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string> TomlDocument::child_tables(const std::string &prefix) const {
  const std::string lead = prefix + ".";
  std::vector<std::string> names;
  for (auto it = values.lower_bound(lead); it != values.end() && starts_with(it->first, lead);
       ++it) {
    const auto dot = it->first.find('.', lead.size());
    if (dot == std::string::npos) {
      continue;
    }
    std::string name = it->first.substr(lead.size(), dot - lead.size());
    // Keys are sorted, so repeats of one table are adjacent.
    if (names.empty() || names.back() != name) {
      names.push_back(std::move(name));
    }
  }
  return names;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string table;
  std::set<std::string> seen_tables;
  std::size_t line_number = 0;

  auto fail = [&line_number](const std::string &reason) {
    return Result<TomlDocument>::failure("line " + std::to_string(line_number) + ": " + reason);
  };

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(line);
    if (clean.empty() || clean.front() == '#') {
      continue;
    }

    if (clean.front() == '[') {
      const auto close = clean.find(']');
      if (close == std::string::npos) {
        return fail("unterminated table header");
      }
      const std::string rest = trim(clean.substr(close + 1));
      if (!rest.empty() && rest.front() != '#') {
        return fail("unexpected text after table header");
      }
      table = trim(clean.substr(1, close - 1));
      if (!is_bare_key(table)) {
        return fail("invalid table name '" + table + "'");
      }
      if (!seen_tables.insert(table).second) {
        return fail("duplicate table '[" + table + "]'");
      }
      continue;
    }

    const auto equals = clean.find('=');
    if (equals == std::string::npos) {
      return fail("expected key = value");
    }
    const std::string key = trim(clean.substr(0, equals));
    if (!is_bare_key(key)) {
      return fail("invalid key '" + key + "'");
    }

    const std::string raw_value = clean.substr(equals + 1);
    ValueReader reader(raw_value);
    auto value = reader.read();
    if (!value.ok()) {
      return fail(value.error());
    }

    const std::string full_key = table.empty() ? key : table + "." + key;
    if (!document.values.emplace(full_key, std::move(value.value())).second) {
      return fail("duplicate key '" + full_key + "'");
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string quoted = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      quoted += "\\\"";
      break;
    case '\\':
      quoted += "\\\\";
      break;
    case '\n':
      quoted += "\\n";
      break;
    case '\t':
      quoted += "\\t";
      break;
    case '\r':
      quoted += "\\r";
      break;
    default:
      quoted.push_back(ch);
      break;
    }
  }
  quoted += '"';
  return quoted;
}

} // namespace archon::common
