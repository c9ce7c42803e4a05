#include "oac/observability/global.hpp"

#include <mutex>

namespace oac::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

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

void record_token_cache(const std::string &outcome, const std::string &path,
                        const std::string &detail) {
  record_event(TokenCacheEvent{.outcome = outcome, .path = path, .detail = detail});
}

void record_token_acquired(const std::string &grant, const std::int64_t lifetime_secs) {
  record_event(TokenAcquiredEvent{.grant = grant, .lifetime_secs = lifetime_secs});
}

void record_token_invalidated(const std::string &reason) {
  record_event(TokenInvalidatedEvent{.reason = reason});
}

void record_http_request(const std::string &method, const std::string &url,
                         const std::uint16_t status, const std::uint32_t attempt,
                         const std::chrono::milliseconds duration) {
  record_event(HttpRequestEvent{.method = method,
                                .url = url,
                                .status = status,
                                .attempt = attempt,
                                .duration = duration});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

} // namespace oac::observability
