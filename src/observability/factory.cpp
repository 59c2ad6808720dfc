#include "mnemo/observability/factory.hpp"

#include "mnemo/common/text.hpp"
#include "mnemo/observability/log_observer.hpp"
#include "mnemo/observability/multi_observer.hpp"
#include "mnemo/observability/noop_observer.hpp"

#include <sstream>

namespace mnemo::observability {

namespace {

std::unique_ptr<IObserver> single_backend(const std::string &backend) {
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.find(',') == std::string::npos) {
    return single_backend(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string p = common::trim(part);
    if (!p.empty()) {
      multi->add(single_backend(p));
    }
  }
  return multi;
}

} // namespace mnemo::observability
