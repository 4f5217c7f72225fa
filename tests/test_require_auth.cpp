#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "archon/auth/require.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace auth = archon::auth;

archon::config::Profile demo_profile() {
  return archon::config::Profile{
      .key = "demo", .name = "Demo", .url = "http://archon.test", .insecure = false};
}

} // namespace

void register_require_auth_tests(std::vector<archon::tests::TestCase> &tests) {
  using archon::tests::require;
  using archon::tests::require_contains;
  using archon::testing::make_tokens;
  using archon::testing::MockHttpClient;
  using archon::testing::TempDir;

  tests.push_back({"require_auth_without_credentials_is_not_authenticated", [] {
                     TempDir dir;
                     auto http = std::make_shared<MockHttpClient>();
                     auth::TokenManager manager(http, auth::TokenStore(dir.path()), {});
                     std::ostringstream notices;

                     auto token = auth::require_auth(manager, demo_profile(), notices);
                     require(!token.ok(), "must fail without credentials");
                     require(token.error().code == auth::AuthErrorCode::NotAuthenticated, "code");
                     require(token.error().remediation() == "Run: archon auth login",
                             token.error().remediation());
                     require(notices.str().empty(), "no refresh notice expected");
                     require(http->requests().empty(), "no network expected");
                   }});

  tests.push_back({"require_auth_rejected_refresh_is_refresh_failed", [] {
                     TempDir dir;
                     auto http = std::make_shared<MockHttpClient>();
                     auth::TokenStore store(dir.path());
                     require(store.save(make_tokens("stale", "dead", 0), "demo").ok(), "seed");
                     http->enqueue_json(401, R"({"error":"expired"})");
                     auth::TokenManager manager(http, store, {});
                     std::ostringstream notices;

                     auto token = auth::require_auth(manager, demo_profile(), notices);
                     require(!token.ok(), "must fail after rejected refresh");
                     require(token.error().code == auth::AuthErrorCode::RefreshFailed, "code");
                     require(notices.str() == "Session expired, refreshing...\n", notices.str());
                     require(!store.load("demo").has_value(), "record purged");
                   }});

  tests.push_back({"require_auth_refreshes_expiring_token", [] {
                     TempDir dir;
                     auto http = std::make_shared<MockHttpClient>();
                     auth::TokenStore store(dir.path());
                     require(store.save(make_tokens("stale", "r", auth::now_ms() + 1000), "demo")
                                 .ok(),
                             "seed");
                     http->enqueue_json(200, R"({"accessToken":"renewed"})");
                     auth::TokenManager manager(http, store, {});
                     std::ostringstream notices;

                     auto token = auth::require_auth(manager, demo_profile(), notices);
                     require(token.ok(), token.error().to_string());
                     require(token.value() == "renewed", token.value());
                     require_contains(notices.str(), "refreshing");
                   }});

  tests.push_back({"require_auth_passes_valid_and_override_tokens", [] {
                     TempDir dir;
                     auto http = std::make_shared<MockHttpClient>();
                     auth::TokenStore store(dir.path());
                     require(store.save(make_tokens("good", "r", auth::now_ms() + 3'600'000),
                                        "demo")
                                 .ok(),
                             "seed");
                     std::ostringstream notices;

                     auth::TokenManager stored_manager(http, store, {});
                     auto stored = auth::require_auth(stored_manager, demo_profile(), notices);
                     require(stored.ok() && stored.value() == "good", "stored token expected");

                     archon::config::Environment env;
                     env.token_override = "ci-token";
                     auth::TokenManager override_manager(http, store, env);
                     auto overridden = auth::require_auth(override_manager, demo_profile(), notices);
                     require(overridden.ok() && overridden.value() == "ci-token",
                             "override expected");
                     require(http->requests().empty(), "no network expected");
                   }});

  tests.push_back({"require_auth_auto_login_failure_propagates", [] {
                     TempDir dir;
                     auto http = std::make_shared<MockHttpClient>();
                     http->enqueue_json(401, R"({"message":"bad password"})");
                     archon::config::Environment env;
                     env.auto_login_user = "admin";
                     env.auto_login_pass = "nope";
                     auth::TokenManager manager(http, auth::TokenStore(dir.path()), env);
                     std::ostringstream notices;

                     auto token = auth::require_auth(manager, demo_profile(), notices);
                     require(!token.ok(), "auto-login failure must fail");
                     require(token.error().code == auth::AuthErrorCode::LoginFailed, "code");
                     require(token.error().message == "bad password", token.error().message);
                   }});
}
