#pragma once

#include "mnemo/memory/embedder.hpp"

namespace mnemo::memory {

class OpenAiEmbedder final : public IEmbedder {
public:
  OpenAiEmbedder(std::string base_url, std::string api_key, std::string model,
                 std::size_t dimensions, std::uint64_t timeout_ms,
                 std::shared_ptr<providers::HttpClient> http_client =
                     std::make_shared<providers::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::string base_url_;
  std::string api_key_;
  std::string model_;
  std::string name_;
  std::size_t dimensions_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<providers::HttpClient> http_client_;
};

} // namespace mnemo::memory
