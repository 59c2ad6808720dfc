#pragma once

#include "mnemo/cache/cache_manager.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mnemo::memory {

using Embedding = std::vector<float>;

struct MemoryRecord {
  std::string id;
  std::string user_id;
  std::string content;
  std::string created_at;
  std::string updated_at;
};

struct SimilarityResult {
  std::string memory_id;
  std::string content;
  double relevance = 0.0;
  std::optional<std::string> created_at;
  std::optional<std::string> updated_at;
};

enum class OperationKind {
  Create,
  Update,
  Delete,
};

[[nodiscard]] std::string_view operation_kind_name(OperationKind kind);
[[nodiscard]] std::optional<OperationKind> operation_kind_from_string(std::string_view value);

struct ConsolidationOperation {
  OperationKind kind = OperationKind::Create;
  std::string memory_id;
  std::string content;
};

enum class SkipReason {
  Size,
  Structural,
  NonPersonal,
  Technical,
  Instruction,
  Arithmetic,
  Translation,
  Grammar,
};

[[nodiscard]] std::string_view skip_reason_name(SkipReason reason);
/// Human-readable status line for a skip.
[[nodiscard]] std::string skip_reason_message(SkipReason reason);

struct ClassifierVerdict {
  bool allowed = true;
  std::optional<SkipReason> reason;

  [[nodiscard]] static ClassifierVerdict allow() { return {}; }
  [[nodiscard]] static ClassifierVerdict skip(const SkipReason why) {
    return ClassifierVerdict{.allowed = false, .reason = why};
  }
};

struct CachedVerdict {
  ClassifierVerdict verdict;
  std::chrono::steady_clock::time_point stored_at;
};

using CacheValue = std::variant<Embedding, std::vector<SimilarityResult>,
                                std::vector<MemoryRecord>, CachedVerdict>;
using EngineCache = cache::CacheManager<CacheValue>;

} // namespace mnemo::memory
