#include "archon/config/config.hpp"

#include "archon/common/fs.hpp"
#include "archon/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

namespace archon::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".archon";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *TOKENS_FOLDER = "tokens";
constexpr const char *LOG_FILENAME = "archon.log";

// libcurl takes timeouts as a long, and 0 means no timeout at all.
common::Status check_timeout(const char *key, const std::uint64_t value) {
  constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<long>::max());
  if (value == 0 || value > max) {
    return common::Status::error(std::string(key) + " must be between 1 and " +
                                 std::to_string(max));
  }
  return common::Status::success();
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
#if defined(_WIN32)
  _putenv_s(name.c_str(), value.c_str());
#else
  setenv(name.c_str(), value.c_str(), 0);
#endif
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    const std::string value = strip_env_quotes(trimmed.substr(eq + 1));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, value);
  }
}

std::optional<std::filesystem::path> unresolved_config_dir() {
  if (auto dir = env_value("ARCHON_CONFIG_DIR"); dir.has_value()) {
    return std::filesystem::path(common::expand_path(*dir));
  }
  if (auto home = common::home_dir(); home.ok()) {
    return home.value() / CONFIG_FOLDER;
  }
  return std::nullopt;
}

bool env_flag(const std::optional<std::string> &value) {
  if (!value.has_value()) {
    return false;
  }
  const std::string normalized = common::to_lower(common::trim(*value));
  return normalized == "1" || normalized == "true" || normalized == "yes";
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

} // namespace

Environment load_environment() {
  if (auto env_file = env_value("ARCHON_ENV_FILE"); env_file.has_value()) {
    load_dotenv_file(common::expand_path(*env_file));
  }
  if (auto dir = unresolved_config_dir(); dir.has_value()) {
    load_dotenv_file(*dir / ".env");
  }

  Environment env;
  env.token_override = env_value("ARCHON_TOKEN");
  env.auto_login_user = env_value("ARCHON_USER");
  env.auto_login_pass = env_value("ARCHON_PASS");
  env.profile_override = env_value("ARCHON_PROFILE");
  env.url_override = env_value("ARCHON_URL");
  if (auto dir = env_value("ARCHON_CONFIG_DIR"); dir.has_value()) {
    env.config_dir = std::filesystem::path(common::expand_path(*dir));
  }
  env.debug = env_flag(env_value("ARCHON_DEBUG"));
  return env;
}

common::Result<std::filesystem::path> config_dir(const Environment &env) {
  if (env.config_dir.has_value()) {
    return common::ensure_dir(*env.config_dir);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

std::filesystem::path config_path(const std::filesystem::path &dir) {
  return dir / CONFIG_FILENAME;
}

std::filesystem::path tokens_dir(const std::filesystem::path &dir) { return dir / TOKENS_FOLDER; }

std::filesystem::path log_path(const std::filesystem::path &dir) { return dir / LOG_FILENAME; }

bool is_valid_profile_key(const std::string &key) {
  if (key.empty() || key.size() > 64) {
    return false;
  }
  for (const char ch : key) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_' || ch == '-')) {
      return false;
    }
  }
  return true;
}

bool is_valid_profile_url(const std::string &url) {
  return common::starts_with(url, "http://") || common::starts_with(url, "https://");
}

Config default_config() {
  Config config;
  config.default_profile = DEFAULT_PROFILE_KEY;
  config.profiles["production"] = Profile{
      .key = "production", .name = "Production", .url = "https://archon.zincapp.com"};
  config.profiles["development"] = Profile{
      .key = "development", .name = "Development", .url = "https://archon.zincapp.dev"};
  config.profiles["local"] =
      Profile{.key = "local", .name = "Local", .url = "http://localhost:4000"};
  return config;
}

common::Result<Config> load_config(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config seeded = default_config();
    auto saved = save_config(seeded, path);
    if (!saved.ok()) {
      return common::Result<Config>::failure(saved.error());
    }
    return common::Result<Config>::success(std::move(seeded));
  }

  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(content.error());
  }

  const auto parsed = common::parse_toml(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure("Invalid config " + path.string() + ": " +
                                           parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.default_profile = doc.get_string("default_profile", DEFAULT_PROFILE_KEY);
  // A present key that is not a non-negative integer reads as 0 and is rejected.
  const auto read_timeout = [&doc](const std::string &key, const std::uint64_t fallback) {
    return doc.has(key) ? doc.get_u64(key, 0) : fallback;
  };
  config.http.timeout_ms = read_timeout("http.timeout_ms", config.http.timeout_ms);
  config.http.auth_timeout_ms = read_timeout("http.auth_timeout_ms", config.http.auth_timeout_ms);
  for (auto checked : {check_timeout("http.timeout_ms", config.http.timeout_ms),
                       check_timeout("http.auth_timeout_ms", config.http.auth_timeout_ms)}) {
    if (!checked.ok()) {
      return common::Result<Config>::failure("Invalid config " + path.string() + ": " +
                                             checked.error());
    }
  }
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  for (const auto &key : doc.child_tables("profiles")) {
    if (!is_valid_profile_key(key)) {
      continue;
    }
    const std::string prefix = "profiles." + key + ".";
    Profile profile;
    profile.key = key;
    profile.name = doc.get_string(prefix + "name", key);
    profile.url = doc.get_string(prefix + "url");
    profile.insecure = doc.get_bool(prefix + "insecure", false);
    config.profiles[key] = std::move(profile);
  }

  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config, const std::filesystem::path &path) {
  std::ostringstream file;
  file << "default_profile = " << common::quote_toml_string(config.default_profile) << "\n";

  file << "\n[http]\n";
  file << "timeout_ms = " << config.http.timeout_ms << "\n";
  file << "auth_timeout_ms = " << config.http.auth_timeout_ms << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  for (const auto &[key, profile] : config.profiles) {
    file << "\n[profiles." << key << "]\n";
    file << "name = " << common::quote_toml_string(profile.name) << "\n";
    file << "url = " << common::quote_toml_string(profile.url) << "\n";
    file << "insecure = " << bool_to_toml(profile.insecure) << "\n";
  }

  return common::write_file_atomic(path, file.str());
}

} // namespace archon::config
