#pragma once

#include "mnemo/config/schema.hpp"
#include "mnemo/memory/types.hpp"
#include "mnemo/providers/traits.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mnemo::memory {

struct RerankOutcome {
  std::vector<SimilarityResult> results;
  /// True when the model's selection was used.
  bool reranked = false;
  /// Set when the model was asked but its answer could not be used.
  std::optional<std::string> fallback_reason;
};

/// Narrows similarity-ranked candidates to the injected set, asking the model when there are
/// more candidates than the trigger allows. Never touches the store.
class RerankingService {
public:
  RerankingService(std::shared_ptr<providers::ICompletionClient> client,
                   config::RerankingConfig config, providers::ModelSettings model);

  [[nodiscard]] bool should_rerank(std::size_t candidate_count, std::size_t max_returned) const;

  /// `candidates` must already be sorted by descending relevance.
  [[nodiscard]] RerankOutcome select(const std::string &query,
                                     const std::vector<SimilarityResult> &candidates,
                                     std::size_t max_returned) const;

private:
  [[nodiscard]] common::Result<std::vector<std::string>>
  ask_model(const std::string &query, const std::vector<SimilarityResult> &pool,
            std::size_t max_returned) const;

  std::shared_ptr<providers::ICompletionClient> client_;
  config::RerankingConfig config_;
  providers::ModelSettings model_;
};

} // namespace mnemo::memory
