#pragma once

#include "mnemo/memory/embedder.hpp"

namespace mnemo::memory {

/// Offline embedder hashing character trigrams and words into a fixed-size normalized vector.
/// Deterministic across runs; useful for tests and air-gapped deployments.
class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions = kDefaultDimensions);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

  static constexpr std::size_t kDefaultDimensions = 384;

private:
  std::size_t dimensions_;
  std::string name_;
};

} // namespace mnemo::memory
