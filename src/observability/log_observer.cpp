#include "oac/observability/log_observer.hpp"

#include "oac/common/fs.hpp"

#include <type_traits>

namespace oac::observability {

std::optional<LogLevel> parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug" || normalized == "trace") {
    return LogLevel::Debug;
  }
  if (normalized == "info") {
    return LogLevel::Info;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

std::string_view log_level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  out_ << "[" << log_level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, TokenCacheEvent>) {
          std::string line = "token.cache outcome=" + evt.outcome + " path=" + evt.path;
          if (!evt.detail.empty()) {
            line += " detail=" + evt.detail;
          }
          log_line(LogLevel::Debug, line);
        } else if constexpr (std::is_same_v<T, TokenAcquiredEvent>) {
          log_line(LogLevel::Info, "token.acquired grant=" + evt.grant +
                                       " lifetime_secs=" + std::to_string(evt.lifetime_secs));
        } else if constexpr (std::is_same_v<T, TokenInvalidatedEvent>) {
          log_line(LogLevel::Info, "token.invalidated reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, HttpRequestEvent>) {
          log_line(LogLevel::Debug, "http.request method=" + evt.method + " url=" + evt.url +
                                        " status=" + std::to_string(evt.status) +
                                        " attempt=" + std::to_string(evt.attempt) +
                                        " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(LogLevel::Warn, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TokenExchangeLatencyMetric>) {
          log_line(LogLevel::Debug,
                   "metric.token_exchange_latency_ms=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

} // namespace oac::observability
