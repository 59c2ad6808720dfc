#pragma once

#include <functional>
#include <string>

namespace mnemo::memory {

struct StatusEvent {
  std::string description;
  bool done = true;
};

/// Host progress callback. May be empty.
using StatusSink = std::function<void(const StatusEvent &)>;

/// Calls the sink if there is one. Exceptions thrown by the sink are logged and dropped.
void emit_status(const StatusSink &sink, std::string description, bool done = true);

} // namespace mnemo::memory
