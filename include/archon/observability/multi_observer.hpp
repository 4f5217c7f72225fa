#pragma once

#include "archon/observability/observer.hpp"

#include <memory>
#include <vector>

namespace archon::observability {

/// Fans every event and metric out to each sink, in order.
class MultiObserver final : public IObserver {
public:
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> sinks);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

  [[nodiscard]] std::size_t size() const { return sinks_.size(); }

private:
  std::vector<std::unique_ptr<IObserver>> sinks_;
};

} // namespace archon::observability
