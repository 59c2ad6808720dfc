#pragma once

#include "mnemo/providers/traits.hpp"

#include <memory>
#include <string>

namespace mnemo::providers {

/// Chat-completions client for OpenAI and API-compatible endpoints.
class CompatibleCompletionClient final : public ICompletionClient {
public:
  CompatibleCompletionClient(std::string name, std::string base_url, std::string api_key,
                             std::shared_ptr<HttpClient> http_client =
                                 std::make_shared<CurlHttpClient>(),
                             HttpHeaders extra_headers = {});

  [[nodiscard]] common::Result<std::string> complete(const CompletionRequest &request) override;
  [[nodiscard]] std::string name() const override { return name_; }

  [[nodiscard]] std::string build_body(const CompletionRequest &request) const;

private:
  [[nodiscard]] common::Status validate_response_status(const HttpResponse &response) const;

  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  HttpHeaders extra_headers_;
};

} // namespace mnemo::providers
