#include "mnemo/memory/reranker.hpp"

#include "mnemo/common/json_util.hpp"
#include "mnemo/common/text.hpp"
#include "mnemo/memory/prompts.hpp"
#include "mnemo/observability/global.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace mnemo::memory {

namespace {

std::size_t scaled(const std::size_t count, const double multiplier) {
  return static_cast<std::size_t>(std::floor(static_cast<double>(count) * multiplier));
}

std::vector<SimilarityResult> truncated(const std::vector<SimilarityResult> &candidates,
                                        const std::size_t limit) {
  const auto end = candidates.begin() +
                   static_cast<std::ptrdiff_t>(std::min(limit, candidates.size()));
  return {candidates.begin(), end};
}

} // namespace

RerankingService::RerankingService(std::shared_ptr<providers::ICompletionClient> client,
                                   config::RerankingConfig config,
                                   providers::ModelSettings model)
    : client_(std::move(client)), config_(config), model_(std::move(model)) {}

bool RerankingService::should_rerank(const std::size_t candidate_count,
                                     const std::size_t max_returned) const {
  if (!config_.enabled || client_ == nullptr) {
    return false;
  }
  return candidate_count > scaled(max_returned, config_.trigger_multiplier);
}

RerankOutcome RerankingService::select(const std::string &query,
                                       const std::vector<SimilarityResult> &candidates,
                                       const std::size_t max_returned) const {
  if (!should_rerank(candidates.size(), max_returned)) {
    return RerankOutcome{.results = truncated(candidates, max_returned)};
  }

  const auto pool = truncated(candidates, scaled(max_returned, config_.extension_multiplier));
  auto ids = ask_model(query, pool, max_returned);
  if (!ids.ok()) {
    observability::record_error("reranker", "falling back to similarity order: " + ids.error());
    return RerankOutcome{.results = truncated(candidates, max_returned),
                         .reranked = false,
                         .fallback_reason = ids.error()};
  }

  std::vector<SimilarityResult> selected;
  std::unordered_set<std::string> seen;
  for (const auto &id : ids.value()) {
    if (selected.size() >= max_returned) {
      break;
    }
    if (seen.contains(id)) {
      continue;
    }
    const auto it = std::find_if(pool.begin(), pool.end(),
                                 [&](const auto &candidate) { return candidate.memory_id == id; });
    if (it == pool.end()) {
      continue;
    }
    seen.insert(id);
    selected.push_back(*it);
  }
  return RerankOutcome{.results = std::move(selected), .reranked = true};
}

common::Result<std::vector<std::string>>
RerankingService::ask_model(const std::string &query, const std::vector<SimilarityResult> &pool,
                            const std::size_t max_returned) const {
  using IdsResult = common::Result<std::vector<std::string>>;

  std::string memories;
  for (const auto &line : format_memory_lines(pool, std::string::npos)) {
    memories += line + "\n";
  }

  providers::CompletionRequest request{
      .system_prompt = rerank_system_prompt(max_returned),
      .user_prompt = "CURRENT DATE/TIME: " +
                     format_prompt_datetime(std::chrono::system_clock::now()) +
                     "\n\nUSER MESSAGE: " + query + "\n\nCANDIDATE MEMORIES:\n" + memories,
      .schema = rerank_schema(),
      .model = model_.model,
      .temperature = model_.temperature,
      .timeout_ms = model_.timeout_ms,
  };

  const auto started = std::chrono::steady_clock::now();
  auto reply = client_->complete(request);
  observability::record_latency("rerank", std::chrono::duration_cast<std::chrono::milliseconds>(
                                              std::chrono::steady_clock::now() - started));
  if (!reply.ok()) {
    if (reply.kind() == common::ErrorKind::Timeout) {
      observability::record_stage_timeout("reranker", "select");
    }
    return IdsResult::failure(reply.status());
  }

  const auto raw = common::json_get_raw(reply.value(), "ids");
  if (!raw.has_value() || raw->empty() || raw->front() != '[') {
    return IdsResult::failure(common::ErrorKind::ValidationFailure, "reply has no ids array");
  }
  std::vector<std::string> ids;
  for (const auto &element : common::json_split_array(*raw)) {
    const std::string value = common::trim(element);
    if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
      return IdsResult::failure(common::ErrorKind::ValidationFailure,
                                "ids must be strings, got " + value);
    }
    ids.push_back(common::json_unescape(value.substr(1, value.size() - 2)));
  }
  return IdsResult::success(std::move(ids));
}

} // namespace mnemo::memory
