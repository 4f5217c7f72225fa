#pragma once

#include "archon/observability/observer.hpp"

#include <memory>

namespace archon::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_login(const std::string &profile, const std::string &username, bool success);
void record_token_refresh(const std::string &profile, bool success);
void record_token_resolved(const std::string &profile, const std::string &source);
void record_api_request(const std::string &method, const std::string &path, std::uint16_t status,
                        std::chrono::milliseconds duration);
void record_error(const std::string &component, const std::string &message);

} // namespace archon::observability
