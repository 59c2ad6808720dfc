#include "mnemo/memory/consolidation.hpp"

#include "mnemo/common/json_util.hpp"
#include "mnemo/common/text.hpp"
#include "mnemo/memory/classifier.hpp"
#include "mnemo/memory/prompts.hpp"
#include "mnemo/observability/global.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <iomanip>
#include <sstream>

namespace mnemo::memory {

namespace {

constexpr std::size_t kPreviewChars = 100;

std::string format_seconds(const std::chrono::milliseconds elapsed) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << static_cast<double>(elapsed.count()) / 1000.0
      << "s";
  return out.str();
}

std::string summary_line(const ConsolidationReport &report) {
  std::vector<std::string> parts;
  if (report.created > 0) {
    parts.push_back("Created " + std::to_string(report.created));
  }
  if (report.updated > 0) {
    parts.push_back("Updated " + std::to_string(report.updated));
  }
  if (report.deleted > 0) {
    parts.push_back("Deleted " + std::to_string(report.deleted));
  }

  std::string line;
  if (parts.empty()) {
    line = "No memories changed";
  } else {
    for (std::size_t i = 0; i < parts.size(); ++i) {
      line += (i == 0 ? "" : ", ") + parts[i];
    }
    line += report.applied() == 1 ? " Memory" : " Memories";
  }
  if (report.failed > 0) {
    line += " (Failed " + std::to_string(report.failed) + ")";
  }
  return line;
}

std::vector<SimilarityResult> capped(std::vector<SimilarityResult> results,
                                     const std::size_t limit) {
  if (results.size() > limit) {
    results.resize(limit);
  }
  return results;
}

} // namespace

ConsolidationService::ConsolidationService(std::shared_ptr<IMemoryStore> store,
                                           std::shared_ptr<providers::ICompletionClient> client,
                                           std::shared_ptr<SimilarityEngine> similarity,
                                           std::shared_ptr<EngineCache> cache,
                                           const config::Config &config)
    : store_(std::move(store)), client_(std::move(client)), similarity_(std::move(similarity)),
      cache_(std::move(cache)), config_(config.consolidation), retrieval_(config.retrieval),
      extension_multiplier_(config.reranking.extension_multiplier),
      min_memory_chars_(config.classifier.min_message_chars),
      store_timeout_(std::chrono::milliseconds(config.timeouts.store_ms)),
      model_(providers::ModelSettings{.model = config.provider.model,
                                      .temperature = config.provider.temperature,
                                      .timeout_ms = config.timeouts.llm_ms}) {}

ConsolidationReport ConsolidationService::run(const ConsolidationRequest &request,
                                              const CancellationToken &token,
                                              const StatusSink &sink) {
  const auto started = std::chrono::steady_clock::now();
  ConsolidationReport report;

  const auto finish = [&]() {
    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    observability::record_consolidation(observability::ConsolidationEvent{
        .user_id = request.user_id,
        .created = report.created,
        .updated = report.updated,
        .deleted = report.deleted,
        .failed = report.failed,
        .duration = report.duration,
    });
    return report;
  };
  const auto stop_requested = [&]() {
    if (token.cancelled()) {
      report.cancelled = true;
      return true;
    }
    return false;
  };

  if (stop_requested()) {
    return finish();
  }

  auto candidates = collect_candidates(request);
  if (!candidates.ok()) {
    observability::record_error("consolidation",
                                "candidate collection failed: " + candidates.error());
    emit_status(sink, "Memory consolidation failed: memories unavailable");
    return finish();
  }
  if (stop_requested()) {
    return finish();
  }

  auto planned = plan(request.message, candidates.value());
  if (!planned.ok()) {
    observability::record_error("consolidation", "planning failed: " + planned.error());
    emit_status(sink, "Memory consolidation failed");
    return finish();
  }
  if (planned.value().rejected_by_safety) {
    report.rejected_by_safety = true;
    emit_status(sink, "Memory consolidation skipped: plan deleted too many memories");
    return finish();
  }
  if (planned.value().operations.empty()) {
    return finish();
  }
  if (stop_requested()) {
    return finish();
  }

  std::vector<ConsolidationOperation> operations = planned.value().operations;
  std::unordered_map<std::string, std::string> contents;
  auto current = store_->list_by_user(request.user_id, store_timeout_);
  if (current.ok()) {
    for (const auto &memory : current.value()) {
      contents.emplace(memory.id, memory.content);
    }
    auto deduped = semantic_dedup(request.user_id, operations, current.value());
    if (deduped.ok()) {
      operations = std::move(deduped.value());
    } else {
      observability::record_error("consolidation",
                                  "semantic dedup failed, keeping plan: " + deduped.error());
    }
  } else {
    observability::record_error("consolidation",
                                "could not list memories for dedup: " + current.error());
  }
  if (stop_requested()) {
    return finish();
  }

  const Tally tally = execute(request.user_id, operations, contents, sink);
  report.created = tally.created;
  report.updated = tally.updated;
  report.deleted = tally.deleted;
  report.failed = tally.failed;

  if (report.applied() > 0) {
    refresh_cache(request.user_id);
  }

  if (report.applied() > 0 || report.failed > 0) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    emit_status(sink, "Memory consolidation complete in " + format_seconds(elapsed), false);
    emit_status(sink, summary_line(report));
  }
  return finish();
}

common::Result<std::vector<SimilarityResult>>
ConsolidationService::collect_candidates(const ConsolidationRequest &request) {
  using CandidateResult = common::Result<std::vector<SimilarityResult>>;
  const auto limit = static_cast<std::size_t>(std::floor(
      static_cast<double>(retrieval_.max_memories_returned) * extension_multiplier_));
  const double threshold = similarity_->consolidation_threshold();

  if (request.cached_results.has_value() && !request.cached_results->empty()) {
    return CandidateResult::success(
        capped(SimilarityEngine::filter(*request.cached_results, threshold), limit));
  }

  auto memories = store_->list_by_user(request.user_id, store_timeout_);
  if (!memories.ok()) {
    if (memories.kind() == common::ErrorKind::Timeout) {
      observability::record_stage_timeout("consolidation", "candidates");
    }
    return CandidateResult::failure(memories.status());
  }
  if (memories.value().empty()) {
    return CandidateResult::success({});
  }

  auto scored = similarity_->score(request.user_id, request.message, memories.value());
  if (!scored.ok()) {
    observability::record_error("consolidation", "scoring failed: " + scored.error());
    return CandidateResult::success({});
  }
  return CandidateResult::success(capped(SimilarityEngine::filter(scored.value(), threshold), limit));
}

common::Result<ConsolidationPlan>
ConsolidationService::plan(const std::string &message,
                           const std::vector<SimilarityResult> &candidates) {
  using PlanResult = common::Result<ConsolidationPlan>;
  if (client_ == nullptr) {
    return PlanResult::failure(common::ErrorKind::Internal, "no completion client configured");
  }

  std::string memory_block = "EXISTING MEMORIES FOR CONSOLIDATION:\n";
  if (candidates.empty()) {
    memory_block += "[]\n\nNo existing memories were found. Look for new facts in the message "
                    "below.\n\n";
  } else {
    for (const auto &line :
         format_memory_lines(candidates, retrieval_.max_memory_content_chars)) {
      memory_block += line + "\n";
    }
    memory_block += "\n";
  }

  const providers::CompletionRequest request{
      .system_prompt = consolidation_system_prompt(),
      .user_prompt = "CURRENT DATE/TIME: " +
                     format_prompt_datetime(std::chrono::system_clock::now()) + "\n\n" +
                     memory_block + "USER MESSAGE: " + message,
      .schema = consolidation_schema(),
      .model = model_.model,
      .temperature = model_.temperature,
      .timeout_ms = model_.timeout_ms,
  };

  const auto started = std::chrono::steady_clock::now();
  auto reply = client_->complete(request);
  observability::record_latency("consolidation_plan",
                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started));
  if (!reply.ok()) {
    if (reply.kind() == common::ErrorKind::Timeout) {
      observability::record_stage_timeout("consolidation", "plan");
    }
    return PlanResult::failure(reply.status());
  }

  std::unordered_set<std::string> candidate_ids;
  for (const auto &candidate : candidates) {
    candidate_ids.insert(candidate.memory_id);
  }
  auto operations = parse_operations(reply.value(), candidate_ids);
  if (!operations.ok()) {
    return PlanResult::failure(operations.status());
  }

  const auto &parsed = operations.value();
  if (violates_delete_ratio(parsed.proposed, parsed.proposed_deletes)) {
    observability::record_error("consolidation",
                                "rejecting plan: " + std::to_string(parsed.proposed_deletes) +
                                    " of " + std::to_string(parsed.proposed) +
                                    " operations are deletions");
    return PlanResult::success(ConsolidationPlan{.operations = {}, .rejected_by_safety = true});
  }
  return PlanResult::success(ConsolidationPlan{.operations = dedup_plan(parsed.operations)});
}

common::Result<ParsedOperations>
ConsolidationService::parse_operations(const std::string &reply,
                                       const std::unordered_set<std::string> &candidate_ids) {
  using OpsResult = common::Result<ParsedOperations>;
  const auto raw = common::json_get_raw(reply, "ops");
  if (!raw.has_value() || raw->empty() || raw->front() != '[') {
    return OpsResult::failure(common::ErrorKind::ValidationFailure, "reply has no ops array");
  }

  ParsedOperations parsed;
  auto &operations = parsed.operations;
  for (const auto &element : common::json_split_array(*raw)) {
    const auto fields = common::json_parse_flat(element);
    const auto field = [&](const char *name) {
      const auto it = fields.find(name);
      return it == fields.end() ? std::string() : common::trim(it->second);
    };

    const std::string operation = field("operation");
    const auto kind = operation_kind_from_string(operation);
    if (!kind.has_value()) {
      observability::record_error(
          "consolidation",
          std::string(common::error_kind_name(common::ErrorKind::Unsupported)) +
              " operation dropped: '" + operation + "'");
      continue;
    }
    ++parsed.proposed;
    if (*kind == OperationKind::Delete) {
      ++parsed.proposed_deletes;
    }

    const std::string id = field("id");
    const std::string content = field("content");
    switch (*kind) {
    case OperationKind::Create:
      if (!content.empty()) {
        operations.push_back(ConsolidationOperation{.kind = OperationKind::Create, .content = content});
      }
      break;
    case OperationKind::Update:
      if (candidate_ids.contains(id) && !content.empty()) {
        operations.push_back(ConsolidationOperation{
            .kind = OperationKind::Update, .memory_id = id, .content = content});
      }
      break;
    case OperationKind::Delete:
      if (candidate_ids.contains(id)) {
        operations.push_back(
            ConsolidationOperation{.kind = OperationKind::Delete, .memory_id = id});
      }
      break;
    }
  }
  return OpsResult::success(std::move(parsed));
}

bool ConsolidationService::violates_delete_ratio(const std::size_t proposed,
                                                 const std::size_t deletes) const {
  if (proposed == 0 || proposed < config_.min_ops_for_ratio_check) {
    return false;
  }
  return static_cast<double>(deletes) / static_cast<double>(proposed) > config_.max_delete_ratio;
}

std::vector<ConsolidationOperation>
ConsolidationService::dedup_plan(const std::vector<ConsolidationOperation> &ops) {
  std::vector<ConsolidationOperation> out;
  std::unordered_set<std::string> updated_ids;
  std::unordered_set<std::string> deleted_ids;
  std::unordered_set<std::string> contents;

  for (const auto &op : ops) {
    switch (op.kind) {
    case OperationKind::Delete:
      if (!deleted_ids.insert(op.memory_id).second) {
        continue;
      }
      break;
    case OperationKind::Update:
      if (updated_ids.contains(op.memory_id)) {
        continue;
      }
      [[fallthrough]];
    case OperationKind::Create:
      if (!contents.insert(common::to_lower(common::trim(op.content))).second) {
        continue;
      }
      if (op.kind == OperationKind::Update) {
        updated_ids.insert(op.memory_id);
      }
      break;
    }
    out.push_back(op);
  }
  return out;
}

common::Result<std::vector<ConsolidationOperation>>
ConsolidationService::semantic_dedup(const std::string &user_id,
                                     const std::vector<ConsolidationOperation> &ops,
                                     const std::vector<MemoryRecord> &current) {
  using OpsResult = common::Result<std::vector<ConsolidationOperation>>;

  std::unordered_set<std::string> planned_deletes;
  for (const auto &op : ops) {
    if (op.kind == OperationKind::Delete) {
      planned_deletes.insert(op.memory_id);
    }
  }

  // Memories the plan already removes cannot be duplicated.
  std::vector<const MemoryRecord *> existing;
  std::vector<std::string> texts;
  for (const auto &memory : current) {
    if (planned_deletes.contains(memory.id) ||
        utf8_length(common::trim(memory.content)) < min_memory_chars_) {
      continue;
    }
    existing.push_back(&memory);
    texts.push_back(memory.content);
  }
  if (existing.empty()) {
    return OpsResult::success(ops);
  }

  auto existing_vectors = similarity_->embed_many(user_id, texts);
  if (!existing_vectors.ok()) {
    return OpsResult::failure(existing_vectors.status());
  }

  std::vector<ConsolidationOperation> out;
  std::vector<ConsolidationOperation> extra_deletes;
  for (const auto &op : ops) {
    if (op.kind == OperationKind::Delete) {
      out.push_back(op);
      continue;
    }

    auto vector = similarity_->embed(user_id, op.content);
    if (!vector.ok()) {
      return OpsResult::failure(vector.status());
    }

    const MemoryRecord *duplicate = nullptr;
    for (std::size_t i = 0; i < existing.size(); ++i) {
      if (op.kind == OperationKind::Update && existing[i]->id == op.memory_id) {
        continue;
      }
      if (dot_product(vector.value(), existing_vectors.value()[i]) >= config_.dedup_threshold) {
        duplicate = existing[i];
        break;
      }
    }

    if (duplicate == nullptr) {
      out.push_back(op);
      continue;
    }
    if (op.kind == OperationKind::Create) {
      observability::record_error("consolidation",
                                  "dropping duplicate create of memory " + duplicate->id + ": " +
                                      common::truncate_preview(op.content, kPreviewChars));
      continue;
    }
    out.push_back(op);
    if (planned_deletes.insert(duplicate->id).second) {
      extra_deletes.push_back(
          ConsolidationOperation{.kind = OperationKind::Delete, .memory_id = duplicate->id});
    }
  }

  out.insert(out.end(), extra_deletes.begin(), extra_deletes.end());
  return OpsResult::success(std::move(out));
}

ConsolidationService::Tally
ConsolidationService::execute(const std::string &user_id,
                              const std::vector<ConsolidationOperation> &ops,
                              const std::unordered_map<std::string, std::string> &contents,
                              const StatusSink &sink) {
  Tally tally;
  const std::size_t wave_size = std::max<std::size_t>(1, config_.max_concurrent_operations);

  for (const auto kind : {OperationKind::Create, OperationKind::Update, OperationKind::Delete}) {
    std::vector<ConsolidationOperation> group;
    std::copy_if(ops.begin(), ops.end(), std::back_inserter(group),
                 [kind](const auto &op) { return op.kind == kind; });

    for (std::size_t begin = 0; begin < group.size(); begin += wave_size) {
      const std::size_t end = std::min(group.size(), begin + wave_size);
      std::vector<std::future<common::Status>> futures;
      futures.reserve(end - begin);
      for (std::size_t i = begin; i < end; ++i) {
        futures.push_back(std::async(std::launch::async, [this, user_id, op = group[i]]() {
          return apply(user_id, op);
        }));
      }

      for (std::size_t i = begin; i < end; ++i) {
        const auto &op = group[i];
        const common::Status status = [&]() {
          try {
            return futures[i - begin].get();
          } catch (const std::exception &ex) {
            return common::Status::error(common::ErrorKind::StoreFailure, ex.what());
          }
        }();

        if (!status.ok()) {
          ++tally.failed;
          observability::record_error("consolidation",
                                      std::string(operation_kind_name(op.kind)) + " failed: " +
                                          status.error());
          emit_status(sink, "Failed " + std::string(operation_kind_name(op.kind)), false);
          continue;
        }

        switch (op.kind) {
        case OperationKind::Create:
          ++tally.created;
          emit_status(sink, "Created: " + common::truncate_preview(op.content, kPreviewChars),
                      false);
          break;
        case OperationKind::Update:
          ++tally.updated;
          emit_status(sink, "Updated: " + common::truncate_preview(op.content, kPreviewChars),
                      false);
          break;
        case OperationKind::Delete: {
          ++tally.deleted;
          const auto it = contents.find(op.memory_id);
          const std::string preview = it == contents.end()
                                          ? op.memory_id
                                          : common::truncate_preview(it->second, kPreviewChars);
          emit_status(sink, "Deleted: " + preview, false);
          break;
        }
        }
      }
    }
  }
  return tally;
}

common::Status ConsolidationService::apply(const std::string &user_id,
                                           const ConsolidationOperation &op) {
  common::Status status = common::Status::success();
  switch (op.kind) {
  case OperationKind::Create: {
    const auto created = store_->create(user_id, op.content, store_timeout_);
    status = created.status();
    break;
  }
  case OperationKind::Update:
    status = store_->update(op.memory_id, user_id, op.content, store_timeout_);
    break;
  case OperationKind::Delete:
    status = store_->remove(op.memory_id, user_id, store_timeout_);
    break;
  }
  if (!status.ok() && status.kind() == common::ErrorKind::Timeout) {
    observability::record_stage_timeout("consolidation", "execute");
  }
  return status;
}

void ConsolidationService::refresh_cache(const std::string &user_id) {
  if (cache_ == nullptr) {
    return;
  }
  cache_->clear_user_cache(user_id, cache::CacheKind::Retrieval);
  cache_->clear_user_cache(user_id, cache::CacheKind::Embedding);

  auto memories = store_->list_by_user(user_id, store_timeout_);
  if (!memories.ok()) {
    observability::record_error("consolidation", "cache refresh failed: " + memories.error());
    return;
  }
  cache_->put(user_id, cache::CacheKind::MemoryList,
              cache::make_cache_key(cache::CacheKind::MemoryList, user_id),
              CacheValue{memories.value()});

  std::vector<MemoryRecord> embeddable;
  for (const auto &memory : memories.value()) {
    if (utf8_length(common::trim(memory.content)) >= min_memory_chars_) {
      embeddable.push_back(memory);
    }
  }
  if (const auto status = similarity_->embed_memories(user_id, embeddable); !status.ok()) {
    observability::record_error("consolidation", "re-embedding failed: " + status.error());
  }
}

} // namespace mnemo::memory
