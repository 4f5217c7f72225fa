#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "archon/config/config.hpp"
#include "archon/config/profiles.hpp"

#include <string>
#include <vector>

namespace {

archon::config::ProfileStore make_store(const archon::testing::TempDir &dir,
                                        archon::config::Environment env = {}) {
  return archon::config::ProfileStore(archon::config::config_path(dir.path()), std::move(env));
}

} // namespace

void register_profiles_tests(std::vector<archon::tests::TestCase> &tests) {
  using archon::tests::require;
  using archon::tests::require_contains;
  namespace cfg = archon::config;
  using archon::testing::TempDir;

  tests.push_back({"profiles_set_profile_creates_and_overwrites", [] {
                     TempDir dir;
                     auto store = make_store(dir);
                     auto created = store.set_profile(
                         "demo", cfg::Profile{.name = "Demo", .url = "http://demo:4000"});
                     require(created.ok(), created.error());

                     auto found = store.find("demo");
                     require(found.ok(), found.error());
                     require(found.value().key == "demo", "key should be stamped on save");
                     require(found.value().url == "http://demo:4000", "url mismatch");

                     auto overwritten = store.set_profile(
                         "demo", cfg::Profile{.name = "Demo 2", .url = "https://demo", .insecure = true});
                     require(overwritten.ok(), overwritten.error());
                     auto again = store.find("demo");
                     require(again.ok() && again.value().name == "Demo 2", "overwrite lost");
                     require(again.value().insecure, "insecure flag lost");

                     auto profiles = store.profiles();
                     require(profiles.ok() && profiles.value().size() == 4,
                             "seeded profiles plus demo expected");
                   }});

  tests.push_back({"profiles_invalid_key_is_rejected", [] {
                     TempDir dir;
                     auto store = make_store(dir);
                     auto rejected =
                         store.set_profile("../escape", cfg::Profile{.url = "http://x"});
                     require(!rejected.ok(), "path-like key must be rejected");
                     auto profiles = store.profiles();
                     require(profiles.ok() && profiles.value().size() == 3,
                             "rejected key must not be persisted");
                   }});

  tests.push_back({"profiles_delete_reports_existence", [] {
                     TempDir dir;
                     auto store = make_store(dir);
                     auto missing = store.delete_profile("nope");
                     require(missing.ok() && !missing.value(), "unknown key should report false");
                     auto removed = store.delete_profile("local");
                     require(removed.ok() && removed.value(), "known key should report true");
                     require(!store.find("local").ok(), "deleted profile still present");
                   }});

  tests.push_back({"profiles_deleting_default_reassigns_it", [] {
                     TempDir dir;
                     auto store = make_store(dir);
                     auto removed = store.delete_profile("production");
                     require(removed.ok() && removed.value(), removed.error());
                     auto config = store.load_config();
                     require(config.ok(), config.error());
                     require(config.value().default_profile == "development",
                             "default should move to the first remaining key");

                     require(store.delete_profile("development").value(), "delete development");
                     require(store.delete_profile("local").value(), "delete local");
                     auto emptied = store.load_config();
                     require(emptied.ok(), emptied.error());
                     require(emptied.value().profiles.empty(), "no profiles should remain");
                     require(emptied.value().default_profile == "production",
                             "empty store falls back to the production sentinel");
                   }});

  tests.push_back({"profiles_unknown_default_or_session_fails", [] {
                     TempDir dir;
                     auto store = make_store(dir);
                     auto def = store.set_default_profile("ghost");
                     require(!def.ok(), "unknown default must fail");
                     require(def.error().find("not found");
                     auto session = store.set_session_profile("ghost");
                     require(!session.ok(), "unknown session profile must fail");
                     auto name = store.active_profile_name();
                     require(name.ok() && name.value() == "production",
                             "failed selection must not change the active profile");
                   }});

  tests.push_back({"profiles_active_precedence_session_env_default", [] {
                     TempDir dir;
                     cfg::Environment env;
                     env.profile_override = "development";
                     auto store = make_store(dir, env);
                     require(store.set_default_profile("local").ok(), "set default");

                     auto from_env = store.active_profile_name();
                     require(from_env.ok() && from_env.value() == "development",
                             "environment should beat the persisted default");

                     require(store.set_session_profile("production").ok(), "set session");
                     auto from_session = store.active_profile_name();
                     require(from_session.ok() && from_session.value() == "production",
                             "session override should beat the environment");

                     store.clear_session_profile();
                     auto plain = make_store(dir);
                     auto from_default = plain.active_profile_name();
                     require(from_default.ok() && from_default.value() == "local",
                             "persisted default applies last");
                   }});

  tests.push_back({"profiles_url_override_changes_only_url", [] {
                     TempDir dir;
                     cfg::Environment env;
                     env.url_override = "http://127.0.0.1:9999";
                     auto store = make_store(dir, env);
                     auto active = store.active_profile();
                     require(active.ok(), active.error());
                     require(active.value().key == "production", "key must not change");
                     require(active.value().name == "Production", "name must not change");
                     require(active.value().url == "http://127.0.0.1:9999", "url not overridden");

                     auto stored = store.find("production");
                     require(stored.ok() && stored.value().url == "https://archon.zincapp.com",
                             "override must not be persisted");
                   }});

  tests.push_back({"profiles_active_profile_missing_key_fails", [] {
                     TempDir dir;
                     cfg::Environment env;
                     env.profile_override = "vanished";
                     auto store = make_store(dir, env);
                     auto active = store.active_profile();
                     require(!active.ok(), "missing active profile must fail");
                     require_contains(active.error(), "archon profile list");
                   }});
}
