#include "archon/cli/commands.hpp"

#include "archon/api/client.hpp"
#include "archon/auth/claims.hpp"
#include "archon/auth/require.hpp"
#include "archon/auth/token_manager.hpp"
#include "archon/common/fs.hpp"
#include "archon/config/config.hpp"
#include "archon/runtime/session.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace archon::cli {

namespace {

struct Io {
  std::ostream &out;
  std::ostream &err;
};

std::string version_string() {
#ifdef ARCHON_VERSION
  const std::string version = ARCHON_VERSION;
#else
  const std::string version = "0.1.0";
#endif
  return "archon " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name,
               const std::string &short_name = "") {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name || (!short_name.empty() && args[i] == short_name)) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

// Strips --profile/-p and --config (space or '=' form) from anywhere in args.
bool apply_global_options(std::vector<std::string> &args, runtime::SessionOptions &options,
                          std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    const bool is_profile = args[i] == "--profile" || args[i] == "-p";
    if (is_profile || args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + args[i];
        return false;
      }
      if (is_profile) {
        options.profile_override = args[i + 1];
      } else {
        options.config_dir = std::filesystem::path(common::expand_path(args[i + 1]));
      }
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--profile=") || common::starts_with(args[i], "--config=")) {
      const auto eq = args[i].find('=');
      const auto name = args[i].substr(0, eq);
      const auto value = args[i].substr(eq + 1);
      if (value.empty()) {
        error = "missing value for " + name;
        return false;
      }
      if (name == "--profile") {
        options.profile_override = value;
      } else {
        options.config_dir = std::filesystem::path(common::expand_path(value));
      }
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string default_display_name(const std::string &key) {
  std::string name = key;
  if (!name.empty()) {
    name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
  }
  return name;
}

std::string format_timestamp_ms(const std::int64_t epoch_ms) {
  const std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm{};
  if (gmtime_r(&seconds, &tm) == nullptr) {
    return std::to_string(epoch_ms);
  }
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (epoch_ms % 1000 + 1000) % 1000 << 'Z';
  return out.str();
}

const char *yes_no(const bool value) { return value ? "yes" : "no"; }

void print_auth_error(const Io &io, const auth::AuthError &error) {
  io.err << "Error: " << error.message << "\n";
  if (const auto hint = error.remediation(); !hint.empty()) {
    io.err << hint << "\n";
  }
}

void print_help(std::ostream &out) {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  out << "\n";
  out << BOLD << "  archon" << RESET << DIM << "  infrastructure management CLI" << RESET << "\n";
  out << DIM << "  " << version_string() << RESET << "\n\n";

  out << BOLD << "  USAGE" << RESET << "\n";
  out << DIM << "  $ " << RESET << "archon [--profile KEY] [--config DIR] <command> [options]\n\n";

  out << BOLD << "  PROFILES" << RESET << "\n";
  out << "  " << GREEN << "profile list" << RESET << DIM << "               List profiles" << RESET << "\n";
  out << "  " << GREEN << "profile show" << RESET << " [KEY]" << DIM << "         Show one profile" << RESET << "\n";
  out << "  " << GREEN << "profile create" << RESET << " KEY --url U" << DIM << " Create a profile (--display-name N, --insecure, --use)" << RESET << "\n";
  out << "  " << GREEN << "profile update" << RESET << " KEY" << DIM << "         Change url, display name or TLS policy" << RESET << "\n";
  out << "  " << GREEN << "profile use" << RESET << " KEY" << DIM << "            Set the default profile" << RESET << "\n";
  out << "  " << GREEN << "profile delete" << RESET << " KEY --force" << DIM << " Delete a profile and its saved session" << RESET << "\n\n";

  out << BOLD << "  AUTHENTICATION" << RESET << "\n";
  out << "  " << GREEN << "auth login" << RESET << " [USER] [PASS]" << DIM << "  Login and save credentials" << RESET << "\n";
  out << "  " << GREEN << "auth logout" << RESET << DIM << "                Clear saved credentials" << RESET << "\n";
  out << "  " << GREEN << "auth status" << RESET << DIM << "                Show authentication status" << RESET << "\n";
  out << "  " << GREEN << "auth me" << RESET << DIM << "                    Show the current user" << RESET << "\n";
  out << "  " << GREEN << "auth token" << RESET << DIM << "                 Print a valid access token" << RESET << "\n\n";

  out << BOLD << "  OTHER" << RESET << "\n";
  out << "  " << GREEN << "raw" << RESET << " METHOD PATH [BODY]" << DIM << "    Raw API request (--no-auth)" << RESET << "\n";
  out << "  " << GREEN << "config-path" << RESET << DIM << "                Print the config directory" << RESET << "\n";
  out << "  " << GREEN << "version" << RESET << DIM << "                    Show version" << RESET << "\n\n";

  out << BOLD << "  ENVIRONMENT" << RESET << "\n";
  out << DIM << "  ARCHON_TOKEN, ARCHON_USER, ARCHON_PASS, ARCHON_PROFILE, ARCHON_URL,\n"
      << "  ARCHON_CONFIG_DIR, ARCHON_ENV_FILE, ARCHON_DEBUG" << RESET << "\n\n";
}

// ── profile ───────────────────────────────────────────────────────────────────

int run_profile_create(runtime::Session &session, std::vector<std::string> args, const Io &io) {
  std::string url;
  std::string display_name;
  const bool has_url = take_option(args, "--url", "-u", url);
  const bool has_name = take_option(args, "--display-name", "-n", display_name);
  const bool insecure = take_flag(args, "--insecure", "-k");
  const bool use = take_flag(args, "--use");

  if (args.empty()) {
    io.err << "Usage: archon profile create <key> --url <url> [--display-name <name>] "
              "[--insecure] [--use]\n";
    return 1;
  }
  const std::string key = args[0];

  auto existing = session.profiles().profiles();
  if (!existing.ok()) {
    io.err << "Error: " << existing.error() << "\n";
    return 1;
  }
  if (existing.value().contains(key)) {
    io.err << "Error: Profile '" << key
           << "' already exists. Use 'archon profile update' to modify it.\n";
    return 1;
  }
  if (!has_url || url.empty()) {
    io.err << "Error: --url is required\n";
    return 1;
  }
  if (!config::is_valid_profile_url(url)) {
    io.err << "Error: URL must start with http:// or https://\n";
    return 1;
  }

  config::Profile profile;
  profile.name = has_name && !display_name.empty() ? display_name : default_display_name(key);
  profile.url = url;
  profile.insecure = insecure;

  auto saved = session.profiles().set_profile(key, std::move(profile));
  if (!saved.ok()) {
    io.err << "Error: " << saved.error() << "\n";
    return 1;
  }
  io.out << "Profile '" << key << "' created.\n";

  if (use) {
    auto selected = session.profiles().set_default_profile(key);
    if (!selected.ok()) {
      io.err << "Error: " << selected.error() << "\n";
      return 1;
    }
    io.out << "Now using profile '" << key << "'.\n";
  }
  return 0;
}

int run_profile_update(runtime::Session &session, std::vector<std::string> args, const Io &io) {
  std::string url;
  std::string display_name;
  const bool has_url = take_option(args, "--url", "-u", url);
  const bool has_name = take_option(args, "--display-name", "-n", display_name);
  const bool insecure = take_flag(args, "--insecure", "-k");
  const bool secure = take_flag(args, "--no-insecure");

  if (args.empty()) {
    io.err << "Usage: archon profile update <key> [--url <url>] [--display-name <name>] "
              "[--insecure|--no-insecure]\n";
    return 1;
  }
  const std::string key = args[0];

  auto found = session.profiles().find(key);
  if (!found.ok()) {
    io.err << "Error: " << found.error() << "\n";
    return 1;
  }
  config::Profile profile = found.value();
  if (has_url) {
    if (!config::is_valid_profile_url(url)) {
      io.err << "Error: URL must start with http:// or https://\n";
      return 1;
    }
    profile.url = url;
  }
  if (has_name && !display_name.empty()) {
    profile.name = display_name;
  }
  if (insecure) {
    profile.insecure = true;
  } else if (secure) {
    profile.insecure = false;
  }

  auto saved = session.profiles().set_profile(key, std::move(profile));
  if (!saved.ok()) {
    io.err << "Error: " << saved.error() << "\n";
    return 1;
  }
  io.out << "Profile '" << key << "' updated.\n";
  return 0;
}

int run_profile_delete(runtime::Session &session, std::vector<std::string> args, const Io &io) {
  const bool force = take_flag(args, "--force", "-f");
  if (args.empty()) {
    io.err << "Usage: archon profile delete <key> --force\n";
    return 1;
  }
  const std::string key = args[0];
  if (!force) {
    io.err << "Refusing to delete profile '" << key << "' without --force.\n";
    return 1;
  }

  auto deleted = session.profiles().delete_profile(key);
  if (!deleted.ok()) {
    io.err << "Error: " << deleted.error() << "\n";
    return 1;
  }
  if (!deleted.value()) {
    io.err << "Error: Profile '" << key << "' not found.\n";
    return 1;
  }

  auto removed = session.tokens().logout(key);
  if (!removed.ok()) {
    io.err << "Warning: " << removed.error() << "\n";
  }
  io.out << "Profile '" << key << "' deleted.\n";
  return 0;
}

int run_profile(runtime::Session &session, std::vector<std::string> args, const Io &io) {
  if (args.empty()) {
    io.err << "Usage: archon profile <list|show|create|update|use|delete>\n";
    return 1;
  }
  const std::string sub = args[0];
  args.erase(args.begin());

  if (sub == "list") {
    auto profiles = session.profiles().profiles();
    if (!profiles.ok()) {
      io.err << "Error: " << profiles.error() << "\n";
      return 1;
    }
    const auto active = session.profiles().active_profile_name();
    const std::string active_key = active.ok() ? active.value() : std::string();
    for (const auto &[key, profile] : profiles.value()) {
      io.out << (key == active_key ? "* " : "  ") << key << "  " << profile.name << "  "
             << profile.url;
      if (profile.insecure) {
        io.out << "  (insecure)";
      }
      io.out << "\n";
    }
    return 0;
  }

  if (sub == "show") {
    const auto active = session.profiles().active_profile_name();
    if (!active.ok()) {
      io.err << "Error: " << active.error() << "\n";
      return 1;
    }
    const std::string key = args.empty() ? active.value() : args[0];
    auto found = session.profiles().find(key);
    if (!found.ok()) {
      io.err << "Error: " << found.error() << "\n";
      return 1;
    }
    const auto &profile = found.value();
    io.out << "Name:         " << key << "\n";
    io.out << "Display Name: " << profile.name << "\n";
    io.out << "URL:          " << profile.url << "\n";
    io.out << "Insecure:     " << yes_no(profile.insecure) << "\n";
    io.out << "Active:       " << yes_no(key == active.value()) << "\n";
    return 0;
  }

  if (sub == "create" || sub == "add") {
    return run_profile_create(session, std::move(args), io);
  }
  if (sub == "update") {
    return run_profile_update(session, std::move(args), io);
  }

  if (sub == "use") {
    if (args.empty()) {
      io.err << "Usage: archon profile use <key>\n";
      return 1;
    }
    auto selected = session.profiles().set_default_profile(args[0]);
    if (!selected.ok()) {
      io.err << "Error: " << selected.error() << "\n";
      return 1;
    }
    io.out << "Now using profile '" << args[0] << "'.\n";
    return 0;
  }

  if (sub == "delete") {
    return run_profile_delete(session, std::move(args), io);
  }

  io.err << "Unknown profile command: " << sub << "\n";
  return 1;
}

// ── auth ──────────────────────────────────────────────────────────────────────

int run_auth_login(runtime::Session &session, const config::Profile &profile,
                   const std::vector<std::string> &args, const Io &io) {
  const auto &env = session.environment();
  std::string username = args.size() > 0 ? args[0] : env.auto_login_user.value_or("");
  std::string password = args.size() > 1 ? args[1] : env.auto_login_pass.value_or("");
  if (username.empty() || password.empty()) {
    io.err << "Error: username and password are required "
              "(pass them as arguments or set ARCHON_USER and ARCHON_PASS)\n";
    return 1;
  }

  io.out << "Logging in to " << profile.name << " (" << profile.url << ")\n";
  auto tokens =
      session.tokens().login(profile.key, profile.url, username, password, profile.insecure);
  if (!tokens.ok()) {
    print_auth_error(io, tokens.error());
    return 1;
  }
  io.out << "Authenticated successfully\n";
  io.out << "  Logged in as " << tokens.value().user.username << " (" << tokens.value().user.role
         << ")\n";
  return 0;
}

int run_auth_status(runtime::Session &session, const config::Profile &profile, const Io &io) {
  auto &manager = session.tokens();
  const auto stored = manager.stored_tokens(profile.key);
  const bool logged_in = manager.is_logged_in(profile.key);

  io.out << "Profile:       " << profile.key << "\n";
  io.out << "Profile Name:  " << profile.name << "\n";
  io.out << "URL:           " << profile.url << "\n";
  io.out << "Authenticated: " << yes_no(logged_in) << "\n";
  io.out << "Token State:   " << auth::token_state_name(manager.quick_check(profile.key)) << "\n";
  io.out << "User:          " << (stored.has_value() ? stored->user.username : "-") << "\n";
  io.out << "Role:          " << (stored.has_value() ? stored->user.role : "-") << "\n";
  io.out << "Expires At:    "
         << (stored.has_value() ? format_timestamp_ms(stored->expires_at) : "-") << "\n";

  if (stored.has_value()) {
    // Display only: decoded claims never feed an authorization decision.
    auto claims = auth::decode_display_claims(stored->access_token);
    if (claims.ok()) {
      const auto &decoded = claims.value();
      io.out << "Token Subject: " << (decoded.subject.empty() ? "-" : decoded.subject) << "\n";
      io.out << "Token User:    " << (decoded.username.empty() ? "-" : decoded.username) << "\n";
      io.out << "Token Role:    " << (decoded.role.empty() ? "-" : decoded.role) << "\n";
      if (decoded.expires_at_ms.has_value()) {
        io.out << "Token Expiry:  " << format_timestamp_ms(*decoded.expires_at_ms) << "\n";
      }
    }
  }

  if (!logged_in) {
    io.out << "\nRun: archon auth login\n";
  }
  return 0;
}

int run_auth(runtime::Session &session, std::vector<std::string> args, const Io &io) {
  if (args.empty()) {
    io.err << "Usage: archon auth <login|logout|status|me|token>\n";
    return 1;
  }
  const std::string sub = args[0];
  args.erase(args.begin());

  auto active = session.active_profile();
  if (!active.ok()) {
    io.err << "Error: " << active.error() << "\n";
    return 1;
  }
  const auto &profile = active.value();

  if (sub == "login") {
    return run_auth_login(session, profile, args, io);
  }

  if (sub == "logout") {
    if (!session.tokens().is_logged_in(profile.key)) {
      io.out << "Not logged in to " << profile.name << ".\n";
      return 0;
    }
    auto removed = session.tokens().logout(profile.key);
    if (!removed.ok()) {
      io.err << "Error: " << removed.error() << "\n";
      return 1;
    }
    io.out << "Logged out from " << profile.name << ".\n";
    return 0;
  }

  if (sub == "status") {
    return run_auth_status(session, profile, io);
  }

  if (sub == "me") {
    auto client = session.authenticated_client(profile, io.err);
    if (!client.ok()) {
      print_auth_error(io, client.error());
      return 1;
    }
    auto me = client.value().get("/api/auth/me");
    if (!me.ok()) {
      io.err << api::format_api_error(me.error());
      return 1;
    }
    io.out << me.value() << "\n";
    return 0;
  }

  if (sub == "token") {
    auto token = auth::require_auth(session.tokens(), profile, io.err);
    if (!token.ok()) {
      print_auth_error(io, token.error());
      return 1;
    }
    io.out << token.value() << "\n";
    return 0;
  }

  io.err << "Unknown auth command: " << sub << "\n";
  return 1;
}

// ── raw ───────────────────────────────────────────────────────────────────────

int run_raw(runtime::Session &session, std::vector<std::string> args, const Io &io) {
  const bool no_auth = take_flag(args, "--no-auth");
  if (args.size() < 2) {
    io.err << "Usage: archon raw <method> <path> [body] [--no-auth]\n";
    return 1;
  }
  const std::string method = common::to_upper(args[0]);
  std::string path = args[1];
  if (!common::starts_with(path, "/")) {
    path = "/" + path;
  }
  std::optional<std::string> body;
  if (args.size() > 2) {
    body = args[2];
  }

  auto active = session.active_profile();
  if (!active.ok()) {
    io.err << "Error: " << active.error() << "\n";
    return 1;
  }
  const auto &profile = active.value();

  std::optional<api::ApiClient> client;
  if (no_auth) {
    client.emplace(session.anonymous_client(profile));
  } else {
    auto authed = session.authenticated_client(profile, io.err);
    if (!authed.ok()) {
      print_auth_error(io, authed.error());
      io.err << "Or use --no-auth to skip authentication\n";
      return 1;
    }
    client.emplace(std::move(authed.value()));
  }

  io.err << method << " " << http::join_url(profile.url, path) << "\n";
  auto sent = client->send(method, path, body);
  if (!sent.ok()) {
    io.err << api::format_api_error(sent.error());
    return 1;
  }
  const auto &response = sent.value();
  io.err << "Status: " << response.status << "\n";
  io.out << response.body << "\n";
  return response.ok() ? 0 : 1;
}

} // namespace

int run_cli(std::vector<std::string> args, const config::Environment &env,
            std::shared_ptr<http::HttpClient> http, std::ostream &out, std::ostream &err) {
  const Io io{out, err};

  runtime::SessionOptions options;
  std::string global_error;
  if (!apply_global_options(args, options, global_error)) {
    err << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help(out);
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(out);
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    out << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    config::Environment scoped = env;
    if (options.config_dir.has_value()) {
      scoped.config_dir = options.config_dir;
    }
    auto dir = config::config_dir(scoped);
    if (!dir.ok()) {
      err << dir.error() << "\n";
      return 1;
    }
    out << dir.value().string() << "\n";
    return 0;
  }

  if (subcommand != "profile" && subcommand != "auth" && subcommand != "raw") {
    err << "Unknown command: " << subcommand << "\n";
    print_help(err);
    return 1;
  }

  auto session = runtime::Session::create(options, env, std::move(http));
  if (!session.ok()) {
    err << "Error: " << session.error() << "\n";
    return 1;
  }

  if (subcommand == "profile") {
    return run_profile(session.value(), std::move(args), io);
  }
  if (subcommand == "auth") {
    return run_auth(session.value(), std::move(args), io);
  }
  return run_raw(session.value(), std::move(args), io);
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  const config::Environment env = config::load_environment();
  return run_cli(std::move(args), env, std::make_shared<http::CurlHttpClient>(), std::cout,
                 std::cerr);
}

} // namespace archon::cli
