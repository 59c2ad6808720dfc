#include "mnemo/providers/factory.hpp"

#include "mnemo/providers/compatible.hpp"
#include "mnemo/providers/reliable.hpp"

namespace mnemo::providers {

std::shared_ptr<ICompletionClient> create_completion_client(const config::Config &config,
                                                            std::shared_ptr<HttpClient> http_client) {
  if (!http_client) {
    http_client = std::make_shared<CurlHttpClient>();
  }
  auto primary = std::make_shared<CompatibleCompletionClient>(
      config.provider.name, config.provider.base_url, config.provider.api_key.value_or(""),
      std::move(http_client));
  if (config.provider.max_retries == 0) {
    return primary;
  }
  return std::make_shared<ReliableCompletionClient>(std::move(primary),
                                                    std::vector<std::shared_ptr<ICompletionClient>>{},
                                                    config.provider.max_retries,
                                                    config.provider.backoff_ms);
}

} // namespace mnemo::providers
