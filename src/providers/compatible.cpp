#include "mnemo/providers/compatible.hpp"

#include "mnemo/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace mnemo::providers {

namespace {

common::Status provider_error_status(const ProviderError &error) {
  return common::Status::error(error.error_kind(), error.to_string());
}

} // namespace

CompatibleCompletionClient::CompatibleCompletionClient(std::string name, std::string base_url,
                                                       std::string api_key,
                                                       std::shared_ptr<HttpClient> http_client,
                                                       HttpHeaders extra_headers)
    : name_(std::move(name)), base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)), extra_headers_(std::move(extra_headers)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string CompatibleCompletionClient::build_body(const CompletionRequest &request) const {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(request.model) << "\",";
  body << "\"messages\":[";
  if (!request.system_prompt.empty()) {
    body << "{\"role\":\"system\",\"content\":\"" << common::json_escape(request.system_prompt)
         << "\"},";
  }
  body << "{\"role\":\"user\",\"content\":\"" << common::json_escape(request.user_prompt) << "\"}";
  body << "],";
  if (request.schema.has_value()) {
    body << "\"response_format\":{";
    body << "\"type\":\"json_schema\",";
    body << "\"json_schema\":{";
    body << "\"name\":\"" << common::json_escape(request.schema->name) << "\",";
    body << "\"strict\":true,";
    body << "\"schema\":" << request.schema->schema_json;
    body << "}},";
  }
  body << "\"temperature\":" << request.temperature << ",";
  body << "\"stream\":false";
  body << "}";
  return body.str();
}

common::Status
CompatibleCompletionClient::validate_response_status(const HttpResponse &response) const {
  if (response.timeout) {
    return provider_error_status(
        ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"});
  }

  if (response.network_error) {
    return provider_error_status(ProviderError{.code = ProviderErrorCode::NetworkError,
                                               .message = response.network_error_message});
  }

  if (response.status == 401 || response.status == 403) {
    return provider_error_status(ProviderError{
        .code = ProviderErrorCode::AuthError, .status = response.status, .message = response.body});
  }

  if (response.status == 404) {
    return provider_error_status(ProviderError{.code = ProviderErrorCode::ModelNotFound,
                                               .status = response.status,
                                               .message = response.body});
  }

  if (response.status == 429) {
    ProviderError error{.code = ProviderErrorCode::RateLimitError,
                        .status = response.status,
                        .message = response.body};
    if (const auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      std::uint64_t seconds = 0;
      const auto *first = it->second.data();
      const auto *last = first + it->second.size();
      if (auto [ptr, ec] = std::from_chars(first, last, seconds); ec == std::errc()) {
        error.retry_after = seconds;
      }
    }
    return provider_error_status(error);
  }

  if (response.status < 200 || response.status >= 300) {
    return provider_error_status(ProviderError{
        .code = ProviderErrorCode::ApiError, .status = response.status, .message = response.body});
  }

  return common::Status::success();
}

common::Result<std::string> CompatibleCompletionClient::complete(const CompletionRequest &request) {
  if (api_key_.empty()) {
    return common::Result<std::string>::failure(
        common::ErrorKind::Transport,
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}
            .to_string());
  }

  HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };
  for (const auto &[key, value] : extra_headers_) {
    headers[key] = value;
  }

  const auto response = http_client_->post_json(base_url_ + "/chat/completions", headers,
                                                build_body(request), request.timeout_ms);
  const auto status = validate_response_status(response);
  if (!status.ok()) {
    return common::Result<std::string>::failure(status);
  }

  auto content = parse_openai_content(response.body);
  if (!content.ok() || !request.schema.has_value()) {
    return content;
  }
  return validate_structured_reply(content.value(), *request.schema);
}

} // namespace mnemo::providers
