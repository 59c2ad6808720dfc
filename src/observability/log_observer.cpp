#include "mnemo/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace mnemo::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ClassificationEvent>) {
          log_line(evt.allowed ? "DEBUG" : "INFO",
                   "classifier.verdict allowed=" + bool_text(evt.allowed) +
                       " reason=" + evt.reason +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, RetrievalEvent>) {
          log_line("INFO", "retrieval user=" + evt.user_id +
                               " candidates=" + std::to_string(evt.candidates) +
                               " selected=" + std::to_string(evt.selected) +
                               " reranked=" + bool_text(evt.reranked));
        } else if constexpr (std::is_same_v<T, ConsolidationEvent>) {
          log_line("INFO", "consolidation user=" + evt.user_id +
                               " created=" + std::to_string(evt.created) +
                               " updated=" + std::to_string(evt.updated) +
                               " deleted=" + std::to_string(evt.deleted) +
                               " failed=" + std::to_string(evt.failed) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, CacheEvictionEvent>) {
          log_line("DEBUG", "cache.evict scope=" + evt.scope + " user=" + evt.user_id +
                                (evt.kind.empty() ? std::string() : " kind=" + evt.kind));
        } else if constexpr (std::is_same_v<T, StageTimeoutEvent>) {
          log_line("WARN", evt.component + ": timeout during " + evt.stage);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, LatencyMetric>) {
          log_line("DEBUG", "metric.latency_ms op=" + m.operation + " value=" +
                                std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, CacheSizeMetric>) {
          log_line("DEBUG", "metric.cache users=" + std::to_string(m.users) +
                                " entries=" + std::to_string(m.entries));
        } else if constexpr (std::is_same_v<T, BackgroundTasksMetric>) {
          log_line("DEBUG", "metric.background_tasks=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr.flush();
}

} // namespace mnemo::observability
