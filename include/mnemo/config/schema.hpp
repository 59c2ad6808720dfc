#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace mnemo::config {

struct CacheConfig {
  std::size_t max_users = 50;
  std::size_t max_entries_per_kind = 500;
  std::uint64_t verdict_ttl_seconds = 300;
};

struct ClassifierConfig {
  std::size_t min_message_chars = 10;
  std::size_t max_message_chars = 2500;
  double skip_margin = 0.20;
  // "binary" (personal vs non-personal) or "multi" (per skip category)
  std::string granularity = "binary";
};

struct RetrievalConfig {
  double semantic_threshold = 0.25;
  double relaxed_multiplier = 0.8;
  std::size_t max_memories_returned = 10;
  std::size_t max_memory_content_chars = 500;
};

struct RerankingConfig {
  bool enabled = true;
  double trigger_multiplier = 0.8;
  double extension_multiplier = 1.6;
};

struct ConsolidationConfig {
  bool enabled = true;
  double dedup_threshold = 0.90;
  double max_delete_ratio = 0.6;
  std::size_t min_ops_for_ratio_check = 6;
  std::size_t max_concurrent_operations = 8;
};

struct TimeoutConfig {
  std::uint64_t store_ms = 10'000;
  std::uint64_t llm_ms = 60'000;
  std::uint64_t embedding_ms = 30'000;
};

struct ProviderConfig {
  std::string name = "openai";
  std::string base_url = "https://api.openai.com/v1";
  std::optional<std::string> api_key;
  std::string model = "gpt-4o-mini";
  double temperature = 0.2;
  std::uint32_t max_retries = 2;
  std::uint64_t backoff_ms = 500;
};

struct EmbeddingConfig {
  std::string provider = "local";
  std::string model = "text-embedding-3-small";
  std::size_t dimensions = 384;
  // Empty means "same as provider.base_url".
  std::string base_url;
};

struct StoreConfig {
  std::string backend = "sqlite";
  std::string path = "~/.mnemo/memories.db";
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  CacheConfig cache;
  ClassifierConfig classifier;
  RetrievalConfig retrieval;
  RerankingConfig reranking;
  ConsolidationConfig consolidation;
  TimeoutConfig timeouts;
  ProviderConfig provider;
  EmbeddingConfig embedding;
  StoreConfig store;
  ObservabilityConfig observability;
};

} // namespace mnemo::config
