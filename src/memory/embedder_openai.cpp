#include "mnemo/memory/embedder_openai.hpp"

#include "mnemo/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace mnemo::memory {

namespace {

using BatchResult = common::Result<std::vector<std::vector<float>>>;

BatchResult parse_embedding_response(const std::string &body, const std::size_t expected) {
  const std::string data = common::json_get_array(body, "data");
  if (data.empty()) {
    return BatchResult::failure(common::ErrorKind::ValidationFailure, "embedding data missing");
  }

  std::vector<std::vector<float>> vectors(expected);
  std::vector<bool> filled(expected, false);
  std::size_t position = 0;
  for (const auto &item : common::json_split_array(data)) {
    const auto fields = common::json_parse_flat(item);
    std::size_t index = position++;
    if (const auto it = fields.find("index"); it != fields.end()) {
      const auto *first = it->second.data();
      const auto *last = first + it->second.size();
      if (auto [ptr, ec] = std::from_chars(first, last, index); ec != std::errc()) {
        return BatchResult::failure(common::ErrorKind::ValidationFailure,
                                    "invalid embedding index");
      }
    }
    if (index >= expected) {
      return BatchResult::failure(common::ErrorKind::ValidationFailure,
                                  "embedding index out of range");
    }
    const auto it = fields.find("embedding");
    if (it == fields.end()) {
      return BatchResult::failure(common::ErrorKind::ValidationFailure,
                                  "embedding field missing");
    }
    auto values = common::json_parse_float_array(it->second);
    if (!values.has_value()) {
      return BatchResult::failure(common::ErrorKind::ValidationFailure,
                                  "invalid embedding value");
    }
    vectors[index] = std::move(*values);
    filled[index] = true;
  }

  for (const bool ok : filled) {
    if (!ok) {
      return BatchResult::failure(common::ErrorKind::ValidationFailure,
                                  "embedding response is missing inputs");
    }
  }
  return BatchResult::success(std::move(vectors));
}

} // namespace

OpenAiEmbedder::OpenAiEmbedder(std::string base_url, std::string api_key, std::string model,
                               const std::size_t dimensions, const std::uint64_t timeout_ms,
                               std::shared_ptr<providers::HttpClient> http_client)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)), model_(std::move(model)),
      name_("openai:" + model_), dimensions_(dimensions), timeout_ms_(timeout_ms),
      http_client_(std::move(http_client)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string_view OpenAiEmbedder::name() const { return name_; }

common::Result<std::vector<float>> OpenAiEmbedder::embed(const std::string_view text) {
  auto batch = embed_batch({std::string(text)});
  if (!batch.ok()) {
    return common::Result<std::vector<float>>::failure(batch.status());
  }
  return common::Result<std::vector<float>>::success(std::move(batch.value().front()));
}

BatchResult OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return BatchResult::success({});
  }
  if (api_key_.empty()) {
    return BatchResult::failure(common::ErrorKind::Transport, "missing API key");
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model_) << "\",";
  body << "\"input\":[";
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (i > 0) {
      body << ',';
    }
    body << "\"" << common::json_escape(texts[i]) << "\"";
  }
  body << "]";
  body << "}";

  const providers::HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto response =
      http_client_->post_json(base_url_ + "/embeddings", headers, body.str(), timeout_ms_);
  if (response.timeout) {
    return BatchResult::failure(common::ErrorKind::Timeout, "embedding request timed out");
  }
  if (response.network_error) {
    return BatchResult::failure(common::ErrorKind::Transport, response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return BatchResult::failure(common::ErrorKind::Transport,
                                "embedding API error status=" + std::to_string(response.status));
  }

  auto parsed = parse_embedding_response(response.body, texts.size());
  if (!parsed.ok()) {
    return parsed;
  }
  for (auto &vector : parsed.value()) {
    if (vector.size() != dimensions_) {
      vector.resize(dimensions_, 0.0F);
    }
  }
  return parsed;
}

std::size_t OpenAiEmbedder::dimensions() const { return dimensions_; }

} // namespace mnemo::memory
