#include "mnemo/memory/embedder.hpp"

#include "mnemo/common/text.hpp"
#include "mnemo/memory/embedder_local.hpp"
#include "mnemo/memory/embedder_openai.hpp"

namespace mnemo::memory {

std::shared_ptr<IEmbedder> create_embedder(const config::Config &config,
                                           std::shared_ptr<providers::HttpClient> http_client) {
  const std::string provider = common::to_lower(config.embedding.provider);

  if (provider == "openai" && config.provider.api_key.has_value() &&
      !config.provider.api_key->empty()) {
    if (!http_client) {
      http_client = std::make_shared<providers::CurlHttpClient>();
    }
    const std::string base_url =
        config.embedding.base_url.empty() ? config.provider.base_url : config.embedding.base_url;
    return std::make_shared<OpenAiEmbedder>(base_url, *config.provider.api_key,
                                            config.embedding.model, config.embedding.dimensions,
                                            config.timeouts.embedding_ms, std::move(http_client));
  }

  return std::make_shared<LocalEmbedder>(config.embedding.dimensions);
}

} // namespace mnemo::memory
