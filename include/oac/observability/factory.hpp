#pragma once

#include "oac/config/schema.hpp"
#include "oac/observability/observer.hpp"

#include <memory>

namespace oac::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace oac::observability
