#pragma once

#include "mnemo/common/result.hpp"
#include "mnemo/config/schema.hpp"
#include "mnemo/memory/classifier.hpp"
#include "mnemo/memory/consolidation.hpp"
#include "mnemo/memory/embedder.hpp"
#include "mnemo/memory/reranker.hpp"
#include "mnemo/memory/similarity.hpp"
#include "mnemo/memory/status.hpp"
#include "mnemo/memory/store.hpp"
#include "mnemo/memory/task_registry.hpp"
#include "mnemo/providers/traits.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mnemo::memory {

struct ChatMessage {
  std::string role;
  std::string content;
};

/// Background block placed in front of the conversation. Each memory becomes one
/// whitespace-collapsed `- ` line.
[[nodiscard]] std::string build_context_block(const std::vector<SimilarityResult> &memories,
                                              std::chrono::system_clock::time_point now);

/// Appends `block` to the first system message, or inserts a new leading system message.
[[nodiscard]] std::vector<ChatMessage> inject_context(std::vector<ChatMessage> messages,
                                                      const std::string &block);

/// Index of the last message with role "user".
[[nodiscard]] std::optional<std::size_t> last_user_message(const std::vector<ChatMessage> &messages);

/// Host-facing entry point. Owns the cache and the pipeline services; the store, model client
/// and embedder are shared with the host.
class MemoryEngine {
public:
  MemoryEngine(const config::Config &config, std::shared_ptr<IMemoryStore> store,
               std::shared_ptr<providers::ICompletionClient> client,
               std::shared_ptr<IEmbedder> embedder);
  ~MemoryEngine();

  MemoryEngine(const MemoryEngine &) = delete;
  MemoryEngine &operator=(const MemoryEngine &) = delete;

  /// Returns the messages with relevant memories injected, or unchanged when the last user
  /// message is skipped or anything fails along the way.
  [[nodiscard]] std::vector<ChatMessage> on_incoming(const std::vector<ChatMessage> &messages,
                                                     const std::string &user_id,
                                                     const StatusSink &sink = {});

  /// Starts background consolidation for the last user message. Returns true when a task was
  /// submitted.
  bool on_outgoing(const std::vector<ChatMessage> &messages, const std::string &user_id,
                   const StatusSink &sink = {});

  /// Cancels and waits for background work, then drops every cached entry. Safe to call twice.
  void shutdown();

  /// Blocks until submitted consolidation tasks finish.
  void wait_for_background_tasks();

  [[nodiscard]] EngineCache &cache() { return *cache_; }
  [[nodiscard]] std::size_t active_tasks() const { return registry_.active_count(); }

private:
  [[nodiscard]] common::Result<std::vector<MemoryRecord>> load_memories(const std::string &user_id);
  void report_cache_size() const;

  config::Config config_;
  std::shared_ptr<IMemoryStore> store_;
  std::shared_ptr<EngineCache> cache_;
  std::shared_ptr<SimilarityEngine> similarity_;
  std::unique_ptr<ContentClassifier> classifier_;
  std::unique_ptr<RerankingService> reranker_;
  std::shared_ptr<ConsolidationService> consolidation_;
  BackgroundTaskRegistry registry_;
};

/// Wires the configured store, completion client and embedder into an engine.
[[nodiscard]] common::Result<std::unique_ptr<MemoryEngine>>
create_memory_engine(const config::Config &config);

} // namespace mnemo::memory
