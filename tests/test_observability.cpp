#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "archon/auth/token_manager.hpp"
#include "archon/observability/factory.hpp"
#include "archon/observability/global.hpp"
#include "archon/observability/log_observer.hpp"
#include "archon/observability/multi_observer.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace ob = archon::observability;

struct CapturedState {
  std::vector<ob::ObserverEvent> events;
  int metrics = 0;
};

class CapturingObserver final : public ob::IObserver {
public:
  explicit CapturingObserver(CapturedState *state) : state_(state) {}

  void record_event(const ob::ObserverEvent &event) override { state_->events.push_back(event); }
  void record_metric(const ob::ObserverMetric &) override { ++state_->metrics; }
  [[nodiscard]] std::string_view name() const override { return "capturing"; }

private:
  CapturedState *state_ = nullptr;
};

// Restores the silent default once a test is done with the global sink.
struct GlobalObserverGuard {
  ~GlobalObserverGuard() { ob::set_global_observer(nullptr); }
};

} // namespace

void register_observability_tests(std::vector<archon::tests::TestCase> &tests) {
  using archon::tests::require;
  using archon::tests::require_contains;

  tests.push_back({"observability_factory_selects_backends", [] {
                     archon::testing::TempDir dir;
                     const auto log_file = dir.path() / "logs" / "archon.log";

                     auto none = ob::create_observer("none", log_file);
                     require(none.ok() && none.value() == nullptr, "none disables observation");
                     auto empty = ob::create_observer("", log_file);
                     require(empty.ok() && empty.value() == nullptr, "empty disables observation");

                     auto log = ob::create_observer(" LOG ", log_file);
                     require(log.ok() && log.value()->name() == "log", "log backend");

                     auto both = ob::create_observer("log,file", log_file);
                     require(both.ok(), both.error());
                     require(both.value()->name() == "multi", "list is multi");
                     require(std::filesystem::exists(log_file), "file backend creates the log");

                     auto unknown = ob::create_observer("log,statsd", log_file);
                     require(!unknown.ok(), "unknown backend rejected");
                     require_contains(unknown.error(), "statsd");
                   }});

  tests.push_back({"observability_file_backend_appends_lines", [] {
                     archon::testing::TempDir dir;
                     const auto log_file = dir.path() / "archon.log";
                     for (int run = 0; run < 2; ++run) {
                       auto observer = ob::create_observer("file", log_file);
                       require(observer.ok(), observer.error());
                       observer.value()->record_event(
                           ob::TokenRefreshEvent{.profile = "p", .success = true});
                       observer.value()->flush();
                     }
                     const auto text = dir.read_file("archon.log");
                     require(text == "[INFO] auth.refresh profile=p success=true\n"
                                     "[INFO] auth.refresh profile=p success=true\n",
                             text);
                   }});

  tests.push_back({"observability_log_observer_writes_levelled_lines", [] {
                     std::ostringstream out;
                     ob::LogObserver observer(out);
                     observer.record_event(ob::LoginEvent{
                         .profile = "demo", .username = "admin", .success = false});
                     observer.record_event(ob::ApiRequestEvent{.method = "GET",
                                                               .path = "/api/auth/me",
                                                               .status = 200,
                                                               .duration =
                                                                   std::chrono::milliseconds(12)});
                     observer.record_event(ob::ErrorEvent{.component = "api", .message = "boom"});
                     observer.record_metric(
                         ob::RequestLatencyMetric{.latency = std::chrono::milliseconds(12)});
                     observer.flush();

                     const auto text = out.str();
                     require_contains(text,
                                      "[WARN] auth.login profile=demo user=admin success=false");
                     require_contains(text,
                                      "[DEBUG] api.request GET /api/auth/me status=200 "
                                      "duration_ms=12");
                     require_contains(text, "[ERROR] api: boom");
                     require_contains(text, "metric.request_latency_ms=12");
                   }});

  tests.push_back({"observability_multi_observer_fans_out", [] {
                     CapturedState first;
                     CapturedState second;
                     std::vector<std::unique_ptr<ob::IObserver>> sinks;
                     sinks.push_back(std::make_unique<CapturingObserver>(&first));
                     sinks.push_back(nullptr);
                     sinks.push_back(std::make_unique<CapturingObserver>(&second));
                     ob::MultiObserver multi(std::move(sinks));
                     require(multi.size() == 2, "null sinks dropped");
                     multi.record_event(ob::TokenRefreshEvent{.profile = "p", .success = true});
                     multi.record_metric(ob::RequestLatencyMetric{});
                     require(first.events.size() == 1 && second.events.size() == 1,
                             "both observers get the event");
                     require(first.metrics == 1 && second.metrics == 1,
                             "both observers get the metric");
                   }});

  tests.push_back({"observability_token_lifecycle_reports_events", [] {
                     CapturedState state;
                     const GlobalObserverGuard guard;
                     ob::set_global_observer(std::make_unique<CapturingObserver>(&state));

                     archon::testing::TempDir dir;
                     auto http = std::make_shared<archon::testing::MockHttpClient>();
                     http->enqueue_json(200, R"({"accessToken":"secret-access","refreshToken":"r"})");
                     archon::auth::TokenManager manager(
                         http, archon::auth::TokenStore(dir.path()), {});

                     require(manager.login("demo", "http://h", "admin", "pw").ok(), "login");
                     auto token = manager.get_valid_token("demo", "http://h");
                     require(token.ok(), "resolve");

                     bool saw_login = false;
                     bool saw_resolved = false;
                     for (const auto &event : state.events) {
                       if (const auto *login = std::get_if<ob::LoginEvent>(&event)) {
                         saw_login = login->success && login->profile == "demo";
                       }
                       if (const auto *resolved = std::get_if<ob::TokenResolvedEvent>(&event)) {
                         saw_resolved = resolved->source == "stored";
                       }
                     }
                     require(saw_login, "successful login event expected");
                     require(saw_resolved, "token resolution event expected");
                   }});

  tests.push_back({"observability_log_output_never_contains_tokens", [] {
                     std::ostringstream out;
                     const GlobalObserverGuard guard;
                     ob::set_global_observer(std::make_unique<ob::LogObserver>(out));

                     archon::testing::TempDir dir;
                     auto http = std::make_shared<archon::testing::MockHttpClient>();
                     http->enqueue_json(200, R"({"accessToken":"secret-access",)"
                                             R"("refreshToken":"secret-refresh"})");
                     archon::auth::TokenManager manager(
                         http, archon::auth::TokenStore(dir.path()), {});
                     require(manager.login("demo", "http://h", "admin", "hunter2").ok(), "login");

                     const auto text = out.str();
                     require_contains(text, "auth.login");
                     require(text.find("secret-access") == std::string::npos, "access token leaked");
                     require(text.find("secret-refresh") == std::string::npos,
                             "refresh token leaked");
                     require(text.find("hunter2") == std::string::npos, "password leaked");
                   }});
}
