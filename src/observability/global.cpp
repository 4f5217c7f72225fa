#include "archon/observability/global.hpp"

namespace archon::observability {

namespace {

std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() { return g_observer.get(); }

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_login(const std::string &profile, const std::string &username, const bool success) {
  record_event(LoginEvent{.profile = profile, .username = username, .success = success});
}

void record_token_refresh(const std::string &profile, const bool success) {
  record_event(TokenRefreshEvent{.profile = profile, .success = success});
}

void record_token_resolved(const std::string &profile, const std::string &source) {
  record_event(TokenResolvedEvent{.profile = profile, .source = source});
}

void record_api_request(const std::string &method, const std::string &path,
                        const std::uint16_t status, const std::chrono::milliseconds duration) {
  record_event(ApiRequestEvent{
      .method = method, .path = path, .status = status, .duration = duration});
  record_metric(RequestLatencyMetric{.latency = duration});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace archon::observability
