#pragma once

#include "mnemo/config/schema.hpp"
#include "mnemo/memory/embedder.hpp"
#include "mnemo/memory/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace mnemo::memory {

/// Conservative text heuristics for pasted code, logs, markup, command transcripts and encoded
/// blobs. Pure string analysis.
[[nodiscard]] bool detect_structural_skip(const std::string &text);

/// Number of UTF-8 code points.
[[nodiscard]] std::size_t utf8_length(const std::string &text);

/// Decides whether a message is worth memory processing: size limits, then structural
/// heuristics, then embedding similarity against the reference categories.
class ContentClassifier {
public:
  ContentClassifier(std::shared_ptr<IEmbedder> embedder, config::ClassifierConfig config,
                    std::shared_ptr<EngineCache> cache = nullptr,
                    std::chrono::seconds verdict_ttl = std::chrono::seconds(300));

  /// With a user id and an attached cache, recent verdicts for the same message are reused.
  [[nodiscard]] ClassifierVerdict classify(const std::string &message,
                                           const std::string &user_id = {});

  [[nodiscard]] const config::ClassifierConfig &config() const { return config_; }

private:
  [[nodiscard]] ClassifierVerdict evaluate(const std::string &message, bool &cacheable);
  [[nodiscard]] std::optional<SkipReason> semantic_skip(const std::string &trimmed,
                                                        bool &cacheable);

  std::shared_ptr<IEmbedder> embedder_;
  config::ClassifierConfig config_;
  std::shared_ptr<EngineCache> cache_;
  std::chrono::seconds verdict_ttl_;
};

} // namespace mnemo::memory
