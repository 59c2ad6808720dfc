#pragma once

#include "mnemo/observability/observer.hpp"

#include <memory>

namespace mnemo::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_classification(bool allowed, const std::string &reason,
                           std::chrono::milliseconds duration);
void record_retrieval(const std::string &user_id, std::size_t candidates, std::size_t selected,
                      bool reranked);
void record_consolidation(const ConsolidationEvent &event);
void record_cache_eviction(const std::string &scope, const std::string &user_id,
                           const std::string &kind);
void record_stage_timeout(const std::string &component, const std::string &stage);
void record_error(const std::string &component, const std::string &message);
void record_latency(const std::string &operation, std::chrono::milliseconds latency);

} // namespace mnemo::observability
