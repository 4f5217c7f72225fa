#pragma once

#include "archon/observability/observer.hpp"

#include <memory>
#include <ostream>

namespace archon::observability {

/// One `[LEVEL] message` line per event. Never prints credentials.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out);
  explicit LogObserver(std::unique_ptr<std::ostream> owned);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::unique_ptr<std::ostream> owned_;
  std::ostream *out_;
};

} // namespace archon::observability
