#include "archon/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace archon::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

LogObserver::LogObserver(std::unique_ptr<std::ostream> owned)
    : owned_(std::move(owned)), out_(owned_.get()) {}

void LogObserver::record_event(const ObserverEvent &event) {
  auto log_line = [this](const std::string &level, const std::string &message) {
    *out_ << "[" << level << "] " << message << "\n";
  };

  std::visit(
      [&log_line](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, LoginEvent>) {
          log_line(evt.success ? "INFO" : "WARN", "auth.login profile=" + evt.profile +
                                                      " user=" + evt.username +
                                                      " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, TokenRefreshEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "auth.refresh profile=" + evt.profile + " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, TokenResolvedEvent>) {
          log_line("DEBUG", "auth.token profile=" + evt.profile + " source=" + evt.source);
        } else if constexpr (std::is_same_v<T, ApiRequestEvent>) {
          log_line("DEBUG", "api.request " + evt.method + " " + evt.path +
                                " status=" + std::to_string(evt.status) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          *out_ << "[DEBUG] metric.request_latency_ms=" << m.latency.count() << "\n";
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace archon::observability
