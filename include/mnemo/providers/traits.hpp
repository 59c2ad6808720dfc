#pragma once

#include "mnemo/common/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mnemo::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] common::ErrorKind error_kind() const;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body,
                                       std::uint64_t timeout_ms) override;
};

/// JSON schema the reply must satisfy. `required_keys` are the top-level members checked
/// locally after the call, since not every compatible endpoint enforces the schema.
struct OutputSchema {
  std::string name;
  std::string schema_json;
  std::vector<std::string> required_keys;
};

/// Which model to ask and how long to wait for it.
struct ModelSettings {
  std::string model;
  double temperature = 0.2;
  std::uint64_t timeout_ms = 60'000;
};

struct CompletionRequest {
  std::string system_prompt;
  std::string user_prompt;
  std::optional<OutputSchema> schema;
  std::string model;
  double temperature = 0.2;
  std::uint64_t timeout_ms = 60'000;
};

/// Language-model completion. With a schema the returned text is the validated JSON object.
class ICompletionClient {
public:
  virtual ~ICompletionClient() = default;

  [[nodiscard]] virtual common::Result<std::string> complete(const CompletionRequest &request) = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

[[nodiscard]] common::Result<std::string> parse_openai_content(const std::string &response);

/// Extracts the JSON object from a reply and checks the schema's required keys.
[[nodiscard]] common::Result<std::string> validate_structured_reply(const std::string &reply,
                                                                    const OutputSchema &schema);

} // namespace mnemo::providers
