#include "oac/observability/factory.hpp"

#include "oac/common/fs.hpp"
#include "oac/observability/log_observer.hpp"
#include "oac/observability/noop_observer.hpp"

namespace oac::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  const auto level = parse_log_level(config.observability.level).value_or(LogLevel::Warn);
  return std::make_unique<LogObserver>(level);
}

} // namespace oac::observability
