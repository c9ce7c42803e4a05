#pragma once

#include "oac/observability/observer.hpp"

#include <iostream>
#include <ostream>

namespace oac::observability {

/// Writes `[LEVEL] message` lines for events at or above the minimum level.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Warn, std::ostream &out = std::cerr)
      : min_level_(min_level), out_(out) {}

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override { out_.flush(); }
  [[nodiscard]] std::string_view name() const override { return "log"; }

  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream &out_;
};

} // namespace oac::observability
