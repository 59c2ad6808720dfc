#include "mnemo/observability/global.hpp"

#include <mutex>

namespace mnemo::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

std::shared_ptr<IObserver> current_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  // Keep the observer alive while a background task is still logging through it.
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = current_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_classification(const bool allowed, const std::string &reason,
                           const std::chrono::milliseconds duration) {
  record_event(ClassificationEvent{.allowed = allowed, .reason = reason, .duration = duration});
}

void record_retrieval(const std::string &user_id, const std::size_t candidates,
                      const std::size_t selected, const bool reranked) {
  record_event(RetrievalEvent{
      .user_id = user_id, .candidates = candidates, .selected = selected, .reranked = reranked});
}

void record_consolidation(const ConsolidationEvent &event) { record_event(event); }

void record_cache_eviction(const std::string &scope, const std::string &user_id,
                           const std::string &kind) {
  record_event(CacheEvictionEvent{.scope = scope, .user_id = user_id, .kind = kind});
}

void record_stage_timeout(const std::string &component, const std::string &stage) {
  record_event(StageTimeoutEvent{.component = component, .stage = stage});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_latency(const std::string &operation, const std::chrono::milliseconds latency) {
  record_metric(LatencyMetric{.operation = operation, .latency = latency});
}

} // namespace mnemo::observability
