#include "archon/observability/multi_observer.hpp"

namespace archon::observability {

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> sinks) {
  sinks_.reserve(sinks.size());
  for (auto &sink : sinks) {
    if (sink != nullptr) {
      sinks_.push_back(std::move(sink));
    }
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &sink : sinks_) {
    sink->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &sink : sinks_) {
    sink->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &sink : sinks_) {
    sink->flush();
  }
}

} // namespace archon::observability
