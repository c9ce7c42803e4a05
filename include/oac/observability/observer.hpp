#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace oac::observability {

enum class LogLevel { Debug, Info, Warn, Error };

[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &value);
[[nodiscard]] std::string_view log_level_name(LogLevel level);

struct TokenCacheEvent {
  std::string outcome; // hit, miss, expired, invalid, saved
  std::string path;
  std::string detail;
};

struct TokenAcquiredEvent {
  std::string grant;
  std::int64_t lifetime_secs = 0;
};

struct TokenInvalidatedEvent {
  std::string reason;
};

struct HttpRequestEvent {
  std::string method;
  std::string url;
  std::uint16_t status = 0;
  std::uint32_t attempt = 1;
  std::chrono::milliseconds duration{0};
};

struct WarningEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<TokenCacheEvent, TokenAcquiredEvent, TokenInvalidatedEvent,
                                   HttpRequestEvent, WarningEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TokenExchangeLatencyMetric {
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<RequestLatencyMetric, TokenExchangeLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace oac::observability
