#pragma once

#include "mnemo/observability/observer.hpp"

#include <mutex>

namespace mnemo::observability {

class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  // Background consolidation logs from worker threads.
  std::mutex mutex_;
};

} // namespace mnemo::observability
