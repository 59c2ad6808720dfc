#pragma once

#include "mnemo/common/result.hpp"
#include "mnemo/config/schema.hpp"
#include "mnemo/providers/traits.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mnemo::memory {

class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  /// Identity of the model behind this embedder; vectors from different identities are never
  /// compared or cached together.
  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

[[nodiscard]] std::shared_ptr<IEmbedder>
create_embedder(const config::Config &config,
                std::shared_ptr<providers::HttpClient> http_client = nullptr);

} // namespace mnemo::memory
