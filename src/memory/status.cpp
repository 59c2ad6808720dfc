#include "mnemo/memory/status.hpp"

#include "mnemo/observability/global.hpp"

#include <exception>

namespace mnemo::memory {

void emit_status(const StatusSink &sink, std::string description, const bool done) {
  if (!sink) {
    return;
  }
  try {
    sink(StatusEvent{.description = std::move(description), .done = done});
  } catch (const std::exception &ex) {
    observability::record_error("status", std::string("status sink threw: ") + ex.what());
  }
}

} // namespace mnemo::memory
