#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace archon::observability {

struct LoginEvent {
  std::string profile;
  std::string username;
  bool success = false;
};

struct TokenRefreshEvent {
  std::string profile;
  bool success = false;
};

// `source` is one of "override", "auto_login", "stored", "refreshed", "none".
struct TokenResolvedEvent {
  std::string profile;
  std::string source;
};

struct ApiRequestEvent {
  std::string method;
  std::string path;
  std::uint16_t status = 0;
  std::chrono::milliseconds duration{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<LoginEvent, TokenRefreshEvent, TokenResolvedEvent,
                                   ApiRequestEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<RequestLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace archon::observability
