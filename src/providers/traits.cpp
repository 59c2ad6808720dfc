#include "mnemo/providers/traits.hpp"

#include "mnemo/common/json_util.hpp"
#include "mnemo/common/text.hpp"

#include <curl/curl.h>

#include <sstream>

namespace mnemo::providers {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

HttpResponse execute_post(const std::string &url, const HttpHeaders &headers,
                          const std::string &body, const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "mnemo/0.1");
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "Provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::AuthError:
    stream << "auth";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

common::ErrorKind ProviderError::error_kind() const {
  switch (code) {
  case ProviderErrorCode::Timeout:
    return common::ErrorKind::Timeout;
  case ProviderErrorCode::InvalidResponse:
    return common::ErrorKind::ValidationFailure;
  case ProviderErrorCode::ApiError:
  case ProviderErrorCode::NetworkError:
  case ProviderErrorCode::AuthError:
  case ProviderErrorCode::RateLimitError:
  case ProviderErrorCode::ModelNotFound:
    return common::ErrorKind::Transport;
  }
  return common::ErrorKind::Transport;
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return execute_post(url, headers, body, timeout_ms);
}

common::Result<std::string> parse_openai_content(const std::string &response) {
  const std::string choices = common::json_get_array(response, "choices");
  const auto first_choice = common::json_split_array(choices);
  if (first_choice.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::ValidationFailure,
                                                "choices field missing");
  }

  const auto message = common::json_get_raw(first_choice.front(), "message");
  if (!message.has_value()) {
    return common::Result<std::string>::failure(common::ErrorKind::ValidationFailure,
                                                "choices[0].message missing");
  }
  const auto fields = common::json_parse_flat(*message);
  const auto content = fields.find("content");
  if (content == fields.end() || content->second == "null") {
    if (const auto refusal = fields.find("refusal");
        refusal != fields.end() && refusal->second != "null") {
      return common::Result<std::string>::failure(common::ErrorKind::ValidationFailure,
                                                  "model refused: " + refusal->second);
    }
    return common::Result<std::string>::failure(common::ErrorKind::ValidationFailure,
                                                "choices[0].message.content missing");
  }
  return common::Result<std::string>::success(content->second);
}

common::Result<std::string> validate_structured_reply(const std::string &reply,
                                                      const OutputSchema &schema) {
  const auto object = common::json_extract_object(reply);
  if (!object.has_value()) {
    return common::Result<std::string>::failure(common::ErrorKind::ValidationFailure,
                                                "reply for " + schema.name +
                                                    " is not a JSON object");
  }
  const auto fields = common::json_parse_flat(*object);
  for (const auto &key : schema.required_keys) {
    if (!fields.contains(key)) {
      return common::Result<std::string>::failure(common::ErrorKind::ValidationFailure,
                                                  "reply for " + schema.name +
                                                      " is missing '" + key + "'");
    }
  }
  return common::Result<std::string>::success(*object);
}

} // namespace mnemo::providers
