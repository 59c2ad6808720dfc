#pragma once

#include "mnemo/config/schema.hpp"
#include "mnemo/observability/observer.hpp"

#include <memory>

namespace mnemo::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace mnemo::observability
