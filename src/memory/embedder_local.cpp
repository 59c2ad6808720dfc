#include "mnemo/memory/embedder_local.hpp"

#include "mnemo/common/text.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

namespace mnemo::memory {

namespace {

std::uint64_t fnv1a(const std::string_view text) {
  std::uint64_t hash = 1469598103934665603ULL;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= 1099511628211ULL;
  }
  return hash;
}

void add_feature(std::vector<float> &values, const std::string_view feature, const float weight) {
  const auto hash = fnv1a(feature);
  const std::size_t idx = static_cast<std::size_t>(hash % values.size());
  // High bit picks the sign so unrelated features tend to cancel.
  const float sign = (hash >> 63U) != 0 ? -1.0F : 1.0F;
  values[idx] += sign * weight;
}

void normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (const float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-9) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? kDefaultDimensions : dimensions),
      name_("local:" + std::to_string(dimensions_)) {}

std::string_view LocalEmbedder::name() const { return name_; }

common::Result<std::vector<float>> LocalEmbedder::embed(const std::string_view text) {
  std::vector<float> values(dimensions_, 0.0F);
  const std::string lowered = common::to_lower(std::string(text));

  std::string word;
  const auto flush_word = [&]() {
    if (word.empty()) {
      return;
    }
    add_feature(values, "w:" + word, 2.0F);
    const std::string padded = " " + word + " ";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      add_feature(values, std::string_view(padded).substr(i, 3), 1.0F);
    }
    word.clear();
  };

  for (const char ch : lowered) {
    if (std::isalnum(static_cast<unsigned char>(ch)) != 0 ||
        (static_cast<unsigned char>(ch) & 0x80U) != 0) {
      word.push_back(ch);
    } else {
      flush_word();
    }
  }
  flush_word();

  normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

common::Result<std::vector<std::vector<float>>>
LocalEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return common::Result<std::vector<std::vector<float>>>::failure(emb.status());
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

std::size_t LocalEmbedder::dimensions() const { return dimensions_; }

} // namespace mnemo::memory
