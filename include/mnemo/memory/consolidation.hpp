#pragma once

#include "mnemo/common/result.hpp"
#include "mnemo/config/schema.hpp"
#include "mnemo/memory/similarity.hpp"
#include "mnemo/memory/status.hpp"
#include "mnemo/memory/store.hpp"
#include "mnemo/memory/task_registry.hpp"
#include "mnemo/memory/types.hpp"
#include "mnemo/providers/traits.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mnemo::memory {

struct ConsolidationRequest {
  std::string user_id;
  std::string message;
  /// Scores computed by retrieval for the same message, when still cached.
  std::optional<std::vector<SimilarityResult>> cached_results;
};

struct ConsolidationReport {
  std::size_t created = 0;
  std::size_t updated = 0;
  std::size_t deleted = 0;
  std::size_t failed = 0;
  bool rejected_by_safety = false;
  bool cancelled = false;
  std::chrono::milliseconds duration{0};

  [[nodiscard]] std::size_t applied() const { return created + updated + deleted; }
};

/// Operations that passed validation, plus the counts of every recognised operation in the reply.
struct ParsedOperations {
  std::vector<ConsolidationOperation> operations;
  std::size_t proposed = 0;
  std::size_t proposed_deletes = 0;
};

struct ConsolidationPlan {
  std::vector<ConsolidationOperation> operations;
  bool rejected_by_safety = false;
};

/// Turns a message into validated store mutations and applies them:
/// candidates, plan, semantic dedup, execution, cache refresh.
class ConsolidationService {
public:
  ConsolidationService(std::shared_ptr<IMemoryStore> store,
                       std::shared_ptr<providers::ICompletionClient> client,
                       std::shared_ptr<SimilarityEngine> similarity,
                       std::shared_ptr<EngineCache> cache, const config::Config &config);

  [[nodiscard]] ConsolidationReport run(const ConsolidationRequest &request,
                                        const CancellationToken &token,
                                        const StatusSink &sink = {});

  [[nodiscard]] common::Result<std::vector<SimilarityResult>>
  collect_candidates(const ConsolidationRequest &request);

  /// Asks the model for operations. Fails on timeout, transport error or a malformed reply.
  [[nodiscard]] common::Result<ConsolidationPlan>
  plan(const std::string &message, const std::vector<SimilarityResult> &candidates);

  /// Validated operations from a model reply. Unknown kinds, unknown ids and empty content are
  /// dropped; the proposed counts still include invalid entries of a known kind.
  [[nodiscard]] static common::Result<ParsedOperations>
  parse_operations(const std::string &reply, const std::unordered_set<std::string> &candidate_ids);

  /// True when the proposed plan deletes too large a share of what it touches.
  [[nodiscard]] bool violates_delete_ratio(std::size_t proposed, std::size_t deletes) const;

  /// Drops repeated UPDATE/DELETE ids and CREATE/UPDATE content repeated within the plan.
  [[nodiscard]] static std::vector<ConsolidationOperation>
  dedup_plan(const std::vector<ConsolidationOperation> &ops);

  /// Compares CREATE/UPDATE content with the stored memories. Duplicate CREATEs are dropped;
  /// an UPDATE that duplicates another memory keeps its content and deletes the other one.
  [[nodiscard]] common::Result<std::vector<ConsolidationOperation>>
  semantic_dedup(const std::string &user_id, const std::vector<ConsolidationOperation> &ops,
                 const std::vector<MemoryRecord> &current);

  void refresh_cache(const std::string &user_id);

private:
  struct Tally {
    std::size_t created = 0;
    std::size_t updated = 0;
    std::size_t deleted = 0;
    std::size_t failed = 0;
  };

  [[nodiscard]] Tally execute(const std::string &user_id,
                              const std::vector<ConsolidationOperation> &ops,
                              const std::unordered_map<std::string, std::string> &contents,
                              const StatusSink &sink);
  [[nodiscard]] common::Status apply(const std::string &user_id,
                                     const ConsolidationOperation &op);

  std::shared_ptr<IMemoryStore> store_;
  std::shared_ptr<providers::ICompletionClient> client_;
  std::shared_ptr<SimilarityEngine> similarity_;
  std::shared_ptr<EngineCache> cache_;
  config::ConsolidationConfig config_;
  config::RetrievalConfig retrieval_;
  double extension_multiplier_;
  std::size_t min_memory_chars_;
  std::chrono::milliseconds store_timeout_;
  providers::ModelSettings model_;
};

} // namespace mnemo::memory
