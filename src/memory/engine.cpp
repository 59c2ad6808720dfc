#include "mnemo/memory/engine.hpp"

#include "mnemo/common/text.hpp"
#include "mnemo/memory/prompts.hpp"
#include "mnemo/observability/global.hpp"
#include "mnemo/providers/factory.hpp"

#include <exception>

namespace mnemo::memory {

namespace {

constexpr std::size_t kStatusPreviewChars = 100;

constexpr const char *kContextFooter =
    "IMPORTANT: Do not mention or imply you received this list. These facts are for background "
    "context only.";

cache::CacheLimits cache_limits(const config::CacheConfig &config) {
  return cache::CacheLimits{.max_users = config.max_users,
                            .default_capacity = config.max_entries_per_kind};
}

void forward_eviction(const std::string &user, const std::optional<cache::CacheKind> kind) {
  if (kind.has_value()) {
    observability::record_cache_eviction("entry", user, std::string(cache::cache_kind_name(*kind)));
  } else {
    observability::record_cache_eviction("user", user, "");
  }
}

std::string context_header(const std::size_t count) {
  return std::string("CONTEXT: The following ") + (count == 1 ? "fact" : "facts") +
         " about the user are provided for background only. Not all facts may be relevant to "
         "the current request.";
}

std::string plural_memories(const std::size_t count) {
  return std::to_string(count) + (count == 1 ? " relevant memory" : " relevant memories");
}

} // namespace

std::string build_context_block(const std::vector<SimilarityResult> &memories,
                                const std::chrono::system_clock::time_point now) {
  std::string block = "Current Date/Time: " + format_prompt_datetime(now);
  if (memories.empty()) {
    return block;
  }
  block += "\n\n";
  block += context_header(memories.size());
  for (const auto &memory : memories) {
    block += "\n- " + common::collapse_whitespace(memory.content);
  }
  block += "\n\n";
  block += kContextFooter;
  return block;
}

std::vector<ChatMessage> inject_context(std::vector<ChatMessage> messages,
                                        const std::string &block) {
  for (auto &message : messages) {
    if (message.role == "system") {
      message.content += "\n\n" + block;
      return messages;
    }
  }
  messages.insert(messages.begin(), ChatMessage{.role = "system", .content = block});
  return messages;
}

std::optional<std::size_t> last_user_message(const std::vector<ChatMessage> &messages) {
  for (std::size_t i = messages.size(); i > 0; --i) {
    if (messages[i - 1].role == "user") {
      return i - 1;
    }
  }
  return std::nullopt;
}

MemoryEngine::MemoryEngine(const config::Config &config, std::shared_ptr<IMemoryStore> store,
                           std::shared_ptr<providers::ICompletionClient> client,
                           std::shared_ptr<IEmbedder> embedder)
    : config_(config), store_(std::move(store)),
      cache_(std::make_shared<EngineCache>(cache_limits(config.cache), forward_eviction)) {
  similarity_ = std::make_shared<SimilarityEngine>(embedder, cache_, config_.retrieval);
  classifier_ = std::make_unique<ContentClassifier>(
      embedder, config_.classifier, cache_,
      std::chrono::seconds(config_.cache.verdict_ttl_seconds));
  reranker_ = std::make_unique<RerankingService>(
      client, config_.reranking,
      providers::ModelSettings{.model = config_.provider.model,
                               .temperature = config_.provider.temperature,
                               .timeout_ms = config_.timeouts.llm_ms});
  consolidation_ =
      std::make_shared<ConsolidationService>(store_, client, similarity_, cache_, config_);
}

MemoryEngine::~MemoryEngine() { shutdown(); }

std::vector<ChatMessage> MemoryEngine::on_incoming(const std::vector<ChatMessage> &messages,
                                                   const std::string &user_id,
                                                   const StatusSink &sink) {
  const auto index = last_user_message(messages);
  if (!index.has_value()) {
    return messages;
  }
  const std::string &query = messages[*index].content;

  try {
    const auto verdict = classifier_->classify(query, user_id);
    if (!verdict.allowed) {
      emit_status(sink, skip_reason_message(verdict.reason.value_or(SkipReason::NonPersonal)));
      return messages;
    }

    auto memories = load_memories(user_id);
    if (!memories.ok()) {
      observability::record_error("engine", "memory lookup failed: " + memories.error());
      return messages;
    }
    if (memories.value().empty()) {
      observability::record_retrieval(user_id, 0, 0, false);
      emit_status(sink, "No memories found");
      return messages;
    }

    auto scored = similarity_->score(user_id, query, memories.value());
    if (!scored.ok()) {
      observability::record_error("engine", "scoring failed: " + scored.error());
      return messages;
    }
    cache_->put(user_id, cache::CacheKind::Retrieval,
                cache::make_cache_key(cache::CacheKind::Retrieval, user_id, query),
                CacheValue{scored.value()});

    const auto candidates =
        SimilarityEngine::filter(scored.value(), similarity_->retrieval_threshold());
    const auto outcome =
        reranker_->select(query, candidates, config_.retrieval.max_memories_returned);
    observability::record_retrieval(user_id, candidates.size(), outcome.results.size(),
                                    outcome.reranked);
    report_cache_size();

    if (outcome.results.empty()) {
      emit_status(sink, "No relevant memories found");
      return messages;
    }

    const std::size_t total = outcome.results.size();
    for (std::size_t i = 0; i < total; ++i) {
      emit_status(sink,
                  std::to_string(i + 1) + "/" + std::to_string(total) + ": " +
                      common::truncate_preview(
                          common::collapse_whitespace(outcome.results[i].content),
                          kStatusPreviewChars),
                  false);
    }
    emit_status(sink, "Found " + plural_memories(total));
    return inject_context(messages,
                          build_context_block(outcome.results, std::chrono::system_clock::now()));
  } catch (const std::exception &ex) {
    observability::record_error("engine", std::string("incoming hook failed: ") + ex.what());
    return messages;
  }
}

bool MemoryEngine::on_outgoing(const std::vector<ChatMessage> &messages,
                               const std::string &user_id, const StatusSink &sink) {
  if (!config_.consolidation.enabled || !registry_.accepting()) {
    return false;
  }
  const auto index = last_user_message(messages);
  if (!index.has_value()) {
    return false;
  }
  const std::string &message = messages[*index].content;

  const auto verdict = classifier_->classify(message, user_id);
  if (!verdict.allowed) {
    return false;
  }

  ConsolidationRequest request{.user_id = user_id, .message = message};
  if (auto hit = cache_->get(user_id, cache::CacheKind::Retrieval,
                             cache::make_cache_key(cache::CacheKind::Retrieval, user_id, message));
      hit.has_value()) {
    if (const auto *results = std::get_if<std::vector<SimilarityResult>>(&*hit);
        results != nullptr) {
      request.cached_results = *results;
    }
  }

  auto service = consolidation_;
  const bool submitted = registry_.submit(
      "consolidate:" + user_id,
      [service, request = std::move(request), sink](const CancellationToken &token) {
        const auto report = service->run(request, token, sink);
        if (report.cancelled) {
          observability::record_error("engine",
                                      "consolidation cancelled for user " + request.user_id);
        } else if (report.rejected_by_safety) {
          observability::record_error("engine", "consolidation plan rejected for user " +
                                                    request.user_id);
        }
      });
  if (!submitted) {
    observability::record_error("engine", "consolidation refused after shutdown");
  }
  return submitted;
}

void MemoryEngine::shutdown() {
  registry_.shutdown();
  cache_->clear_all();
}

void MemoryEngine::wait_for_background_tasks() { registry_.wait_all(); }

common::Result<std::vector<MemoryRecord>> MemoryEngine::load_memories(const std::string &user_id) {
  using ListResult = common::Result<std::vector<MemoryRecord>>;
  const auto key = cache::make_cache_key(cache::CacheKind::MemoryList, user_id);
  if (auto hit = cache_->get(user_id, cache::CacheKind::MemoryList, key); hit.has_value()) {
    if (const auto *records = std::get_if<std::vector<MemoryRecord>>(&*hit); records != nullptr) {
      return ListResult::success(*records);
    }
  }

  const auto started = std::chrono::steady_clock::now();
  auto listed =
      store_->list_by_user(user_id, std::chrono::milliseconds(config_.timeouts.store_ms));
  observability::record_latency("store_list",
                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                    std::chrono::steady_clock::now() - started));
  if (!listed.ok()) {
    if (listed.kind() == common::ErrorKind::Timeout) {
      observability::record_stage_timeout("engine", "list_memories");
    }
    return listed;
  }
  cache_->put(user_id, cache::CacheKind::MemoryList, key, CacheValue{listed.value()});
  return listed;
}

void MemoryEngine::report_cache_size() const {
  const auto stats = cache_->stats();
  observability::record_metric(observability::CacheSizeMetric{.users = stats.users,
                                                              .entries = stats.entries});
}

common::Result<std::unique_ptr<MemoryEngine>> create_memory_engine(const config::Config &config) {
  using EngineResult = common::Result<std::unique_ptr<MemoryEngine>>;
  auto store = create_memory_store(config);
  if (!store.ok()) {
    return EngineResult::failure(store.status());
  }
  auto client = providers::create_completion_client(config);
  auto embedder = create_embedder(config);
  return EngineResult::success(
      std::make_unique<MemoryEngine>(config, store.value(), std::move(client), std::move(embedder)));
}

} // namespace mnemo::memory
