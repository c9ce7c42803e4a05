#pragma once

#include "oac/observability/observer.hpp"

#include <memory>

namespace oac::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_token_cache(const std::string &outcome, const std::string &path,
                        const std::string &detail = "");
void record_token_acquired(const std::string &grant, std::int64_t lifetime_secs);
void record_token_invalidated(const std::string &reason);
void record_http_request(const std::string &method, const std::string &url, std::uint16_t status,
                         std::uint32_t attempt, std::chrono::milliseconds duration);
void record_warning(const std::string &component, const std::string &message);

} // namespace oac::observability
