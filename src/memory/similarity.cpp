#include "mnemo/memory/similarity.hpp"

#include "mnemo/observability/global.hpp"

#include <algorithm>
#include <cmath>

namespace mnemo::memory {

Embedding l2_normalize(Embedding vector) {
  double norm = 0.0;
  for (const float value : vector) {
    norm += static_cast<double>(value) * static_cast<double>(value);
  }
  norm = std::sqrt(norm);
  if (norm <= 0.0) {
    return vector;
  }
  for (float &value : vector) {
    value = static_cast<float>(value / norm);
  }
  return vector;
}

double dot_product(const Embedding &a, const Embedding &b) {
  if (a.size() != b.size()) {
    return 0.0;
  }
  double sum = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return sum;
}

double cosine_similarity(const Embedding &a, const Embedding &b) {
  if (a.empty() || a.size() != b.size()) {
    return 0.0;
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }
  if (norm_a <= 0.0 || norm_b <= 0.0) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

SimilarityEngine::SimilarityEngine(std::shared_ptr<IEmbedder> embedder,
                                   std::shared_ptr<EngineCache> cache,
                                   config::RetrievalConfig config)
    : embedder_(std::move(embedder)), cache_(std::move(cache)), config_(config) {}

common::Result<Embedding> SimilarityEngine::embed(const std::string &user_id,
                                                  const std::string &text) {
  auto batch = embed_many(user_id, {text});
  if (!batch.ok()) {
    return common::Result<Embedding>::failure(batch.status());
  }
  return common::Result<Embedding>::success(std::move(batch.value().front()));
}

common::Result<std::vector<Embedding>>
SimilarityEngine::embed_many(const std::string &user_id, const std::vector<std::string> &texts) {
  using BatchResult = common::Result<std::vector<Embedding>>;
  if (embedder_ == nullptr) {
    return BatchResult::failure(common::ErrorKind::Internal, "no embedder configured");
  }

  std::vector<Embedding> out(texts.size());
  std::vector<std::size_t> missing;
  std::vector<std::string> missing_texts;

  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (cache_ != nullptr) {
      const auto key = cache::make_cache_key(cache::CacheKind::Embedding, user_id, texts[i]);
      if (auto hit = cache_->get(user_id, cache::CacheKind::Embedding, key); hit.has_value()) {
        if (const auto *vector = std::get_if<Embedding>(&*hit)) {
          out[i] = *vector;
          continue;
        }
      }
    }
    missing.push_back(i);
    missing_texts.push_back(texts[i]);
  }

  if (missing.empty()) {
    return BatchResult::success(std::move(out));
  }

  const auto started = std::chrono::steady_clock::now();
  auto embedded = embedder_->embed_batch(missing_texts);
  if (!embedded.ok()) {
    return BatchResult::failure(embedded.status());
  }
  if (embedded.value().size() != missing.size()) {
    return BatchResult::failure(common::ErrorKind::ValidationFailure,
                                "embedder returned " + std::to_string(embedded.value().size()) +
                                    " vectors for " + std::to_string(missing.size()) + " texts");
  }
  observability::record_latency("embedding", std::chrono::duration_cast<std::chrono::milliseconds>(
                                                 std::chrono::steady_clock::now() - started));

  for (std::size_t j = 0; j < missing.size(); ++j) {
    Embedding normalized = l2_normalize(std::move(embedded.value()[j]));
    if (cache_ != nullptr) {
      const auto key =
          cache::make_cache_key(cache::CacheKind::Embedding, user_id, missing_texts[j]);
      cache_->put(user_id, cache::CacheKind::Embedding, key, CacheValue{normalized});
    }
    out[missing[j]] = std::move(normalized);
  }
  return BatchResult::success(std::move(out));
}

common::Result<std::vector<SimilarityResult>>
SimilarityEngine::score(const std::string &user_id, const std::string &query,
                        const std::vector<MemoryRecord> &memories) {
  using ScoreResult = common::Result<std::vector<SimilarityResult>>;
  if (memories.empty()) {
    return ScoreResult::success({});
  }

  std::vector<std::string> texts;
  texts.reserve(memories.size() + 1);
  texts.push_back(query);
  for (const auto &memory : memories) {
    texts.push_back(memory.content);
  }

  auto vectors = embed_many(user_id, texts);
  if (!vectors.ok()) {
    return ScoreResult::failure(vectors.status());
  }
  const Embedding &query_vector = vectors.value().front();

  std::vector<SimilarityResult> results;
  results.reserve(memories.size());
  for (std::size_t i = 0; i < memories.size(); ++i) {
    const auto &memory = memories[i];
    SimilarityResult result{.memory_id = memory.id,
                            .content = memory.content,
                            .relevance = dot_product(query_vector, vectors.value()[i + 1])};
    if (!memory.created_at.empty()) {
      result.created_at = memory.created_at;
    }
    if (!memory.updated_at.empty()) {
      result.updated_at = memory.updated_at;
    }
    results.push_back(std::move(result));
  }

  std::sort(results.begin(), results.end(), [](const auto &a, const auto &b) {
    if (a.relevance != b.relevance) {
      return a.relevance > b.relevance;
    }
    return a.memory_id < b.memory_id;
  });
  return ScoreResult::success(std::move(results));
}

common::Status SimilarityEngine::embed_memories(const std::string &user_id,
                                                const std::vector<MemoryRecord> &memories) {
  std::vector<std::string> texts;
  for (const auto &memory : memories) {
    if (!memory.content.empty()) {
      texts.push_back(memory.content);
    }
  }
  if (texts.empty()) {
    return common::Status::success();
  }
  const auto embedded = embed_many(user_id, texts);
  return embedded.status();
}

std::vector<SimilarityResult> SimilarityEngine::filter(const std::vector<SimilarityResult> &results,
                                                       const double threshold) {
  std::vector<SimilarityResult> out;
  for (const auto &result : results) {
    if (result.relevance >= threshold) {
      out.push_back(result);
    }
  }
  return out;
}

} // namespace mnemo::memory
