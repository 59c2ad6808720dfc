#pragma once

#include "mnemo/common/result.hpp"
#include "mnemo/memory/embedder.hpp"
#include "mnemo/memory/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mnemo::memory {

inline constexpr std::string_view kPersonalCategory = "personal";

struct ReferenceCategory {
  std::string label;
  std::vector<std::string> exemplar_texts;
  std::vector<Embedding> exemplar_embeddings;
};

/// Built-in anchor descriptions, without embeddings. The first entry is the personal category.
[[nodiscard]] const std::vector<ReferenceCategory> &builtin_reference_categories();

/// Skip reason reported for a non-personal category label.
[[nodiscard]] std::optional<SkipReason> skip_reason_for_category(std::string_view label);

/// Embedded anchor table. Read-only once built.
class ReferenceCategoryTable {
public:
  [[nodiscard]] static common::Result<ReferenceCategoryTable> build(IEmbedder &embedder);

  /// One table per embedder identity for the life of the process. A failed build is not
  /// remembered; the next call tries again.
  [[nodiscard]] static common::Result<std::shared_ptr<const ReferenceCategoryTable>>
  shared(const std::shared_ptr<IEmbedder> &embedder);

  [[nodiscard]] const std::vector<ReferenceCategory> &categories() const { return categories_; }
  [[nodiscard]] const ReferenceCategory *find(std::string_view label) const;

  /// Highest dot product between `vector` and any exemplar of `label`, or nullopt when absent.
  [[nodiscard]] std::optional<double> max_similarity(std::string_view label,
                                                     const Embedding &vector) const;

private:
  std::vector<ReferenceCategory> categories_;
};

} // namespace mnemo::memory
