#pragma once

#include "mnemo/common/result.hpp"
#include "mnemo/config/schema.hpp"
#include "mnemo/memory/embedder.hpp"
#include "mnemo/memory/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace mnemo::memory {

[[nodiscard]] Embedding l2_normalize(Embedding vector);
/// Zero when the dimensions differ.
[[nodiscard]] double dot_product(const Embedding &a, const Embedding &b);
/// Zero for mismatched or zero-length vectors.
[[nodiscard]] double cosine_similarity(const Embedding &a, const Embedding &b);

class SimilarityEngine {
public:
  /// `cache` may be null, in which case every call embeds from scratch.
  SimilarityEngine(std::shared_ptr<IEmbedder> embedder, std::shared_ptr<EngineCache> cache,
                   config::RetrievalConfig config);

  /// Normalized embedding of one text, through the user's embedding cache.
  [[nodiscard]] common::Result<Embedding> embed(const std::string &user_id,
                                                const std::string &text);
  /// Normalized embeddings in input order. Only cache misses reach the embedder, in one batch.
  [[nodiscard]] common::Result<std::vector<Embedding>>
  embed_many(const std::string &user_id, const std::vector<std::string> &texts);

  /// Relevance of every memory to the query, highest first. Ties are ordered by memory id.
  [[nodiscard]] common::Result<std::vector<SimilarityResult>>
  score(const std::string &user_id, const std::string &query,
        const std::vector<MemoryRecord> &memories);

  /// Warms the embedding cache with the given memories.
  [[nodiscard]] common::Status embed_memories(const std::string &user_id,
                                              const std::vector<MemoryRecord> &memories);

  [[nodiscard]] static std::vector<SimilarityResult>
  filter(const std::vector<SimilarityResult> &results, double threshold);

  [[nodiscard]] double retrieval_threshold() const { return config_.semantic_threshold; }
  [[nodiscard]] double consolidation_threshold() const {
    return config_.semantic_threshold * config_.relaxed_multiplier;
  }

private:
  std::shared_ptr<IEmbedder> embedder_;
  std::shared_ptr<EngineCache> cache_;
  config::RetrievalConfig config_;
};

} // namespace mnemo::memory
