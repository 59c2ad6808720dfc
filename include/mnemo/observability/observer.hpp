#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace mnemo::observability {

struct ClassificationEvent {
  bool allowed = true;
  std::string reason;
  std::chrono::milliseconds duration{0};
};

struct RetrievalEvent {
  std::string user_id;
  std::size_t candidates = 0;
  std::size_t selected = 0;
  bool reranked = false;
};

struct ConsolidationEvent {
  std::string user_id;
  std::size_t created = 0;
  std::size_t updated = 0;
  std::size_t deleted = 0;
  std::size_t failed = 0;
  std::chrono::milliseconds duration{0};
};

struct CacheEvictionEvent {
  // "user" when a whole user set was dropped, "entry" for a single key.
  std::string scope;
  std::string user_id;
  std::string kind;
};

struct StageTimeoutEvent {
  std::string component;
  std::string stage;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ClassificationEvent, RetrievalEvent, ConsolidationEvent,
                                   CacheEvictionEvent, StageTimeoutEvent, ErrorEvent>;

struct LatencyMetric {
  std::string operation;
  std::chrono::milliseconds latency{0};
};

struct CacheSizeMetric {
  std::uint64_t users = 0;
  std::uint64_t entries = 0;
};

struct BackgroundTasksMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<LatencyMetric, CacheSizeMetric, BackgroundTasksMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace mnemo::observability
