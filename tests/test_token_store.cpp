#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "archon/auth/token_store.hpp"

#include <sys/stat.h>

#include <filesystem>
#include <string>
#include <vector>

void register_token_store_tests(std::vector<archon::tests::TestCase> &tests) {
  using archon::tests::require;
  using archon::tests::require_contains;
  namespace auth = archon::auth;
  using archon::testing::make_tokens;
  using archon::testing::TempDir;

  tests.push_back({"token_store_save_then_load_returns_same_record", [] {
                     TempDir dir;
                     auth::TokenStore store(dir.path() / "tokens");
                     auto tokens = make_tokens("acc\"ess", "ref\\resh", 1'700'000'000'123,
                                               "admin", "ADMIN");
                     tokens.user.id = 42;
                     auto saved = store.save(tokens, "demo");
                     require(saved.ok(), saved.error());

                     const auto loaded = store.load("demo");
                     require(loaded.has_value(), "record should load");
                     require(*loaded == tokens, "loaded record differs from saved one");
                   }});

  tests.push_back({"token_store_writes_owner_only_json_file", [] {
                     TempDir dir;
                     auth::TokenStore store(dir.path() / "tokens");
                     require(store.save(make_tokens("a", "r", 1), "demo").ok(), "save failed");

                     const auto path = dir.path() / "tokens" / "demo.json";
                     struct stat info {};
                     require(stat(path.c_str(), &info) == 0, "token file missing");
                     require((info.st_mode & 0777) == 0600, "token file must be 0600");

                     const auto text = dir.read_file("tokens/demo.json");
                     require_contains(text, "\"accessToken\"");
                     require_contains(text, "\"expiresAt\": 1");
                   }});

  tests.push_back({"token_store_remove_reports_existence", [] {
                     TempDir dir;
                     auth::TokenStore store(dir.path() / "tokens");
                     auto missing = store.remove("demo");
                     require(missing.ok() && !missing.value(), "nothing to remove yet");

                     require(store.save(make_tokens("a", "r", 1), "demo").ok(), "save failed");
                     auto removed = store.remove("demo");
                     require(removed.ok() && removed.value(), "existing record should be removed");
                     require(!store.load("demo").has_value(), "record should be gone");
                   }});

  tests.push_back({"token_store_profiles_are_isolated", [] {
                     TempDir dir;
                     auth::TokenStore store(dir.path() / "tokens");
                     const auto a = make_tokens("token-a", "refresh-a", 100, "alice");
                     const auto b = make_tokens("token-b", "refresh-b", 200, "bob");
                     require(store.save(a, "a").ok(), "save a");
                     require(store.save(b, "b").ok(), "save b");

                     auto removed = store.remove("a");
                     require(removed.ok() && removed.value(), "remove a");
                     require(!store.load("a").has_value(), "a should be gone");
                     const auto still_b = store.load("b");
                     require(still_b.has_value() && *still_b == b, "b must be untouched");
                   }});

  tests.push_back({"token_store_corrupted_records_load_as_absent", [] {
                     TempDir dir;
                     auth::TokenStore store(dir.path() / "tokens");
                     dir.create_file("tokens/garbage.json", "not json at all");
                     dir.create_file("tokens/noaccess.json",
                                     "{\"refreshToken\": \"r\", \"expiresAt\": 5}");
                     dir.create_file("tokens/noexpiry.json", "{\"accessToken\": \"a\"}");
                     dir.create_file("tokens/textexpiry.json",
                                     "{\"accessToken\": \"a\", \"expiresAt\": \"soon\"}");
                     dir.create_file("tokens/truncated.json", "{\"accessToken\": \"a\", ");

                     for (const char *key :
                          {"garbage", "noaccess", "noexpiry", "textexpiry", "truncated"}) {
                       require(!store.load(key).has_value(),
                               std::string("corrupted record should be absent: ") + key);
                     }
                   }});

  tests.push_back({"token_store_minimal_record_defaults_user", [] {
                     TempDir dir;
                     auth::TokenStore store(dir.path() / "tokens");
                     dir.create_file("tokens/min.json",
                                     "{\"accessToken\": \"a\", \"expiresAt\": 1234}");
                     const auto loaded = store.load("min");
                     require(loaded.has_value(), "minimal record should load");
                     require(loaded->refresh_token.empty(), "refresh token defaults to empty");
                     require(loaded->expires_at == 1234, "expiresAt mismatch");
                     require(loaded->user.id == 0, "user id defaults to 0");
                   }});

  tests.push_back({"token_store_refuses_invalid_profile_keys", [] {
                     TempDir dir;
                     auth::TokenStore store(dir.path() / "tokens");
                     auto saved = store.save(make_tokens("a", "r", 1), "../outside");
                     require(!saved.ok(), "traversal key must be refused");
                     require(!std::filesystem::exists(dir.path() / "outside.json"),
                             "nothing may be written outside the tokens dir");
                     require(!store.load("../outside").has_value(), "load must refuse too");
                     require(!store.remove("a/b").ok(), "remove must refuse too");
                     require(!store.path_for("").ok(), "empty key refused");
                   }});
}
