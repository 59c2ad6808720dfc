#include "mnemo/memory/types.hpp"

#include "mnemo/common/text.hpp"

namespace mnemo::memory {

std::string_view operation_kind_name(const OperationKind kind) {
  switch (kind) {
  case OperationKind::Create:
    return "CREATE";
  case OperationKind::Update:
    return "UPDATE";
  case OperationKind::Delete:
    return "DELETE";
  }
  return "CREATE";
}

std::optional<OperationKind> operation_kind_from_string(const std::string_view value) {
  const std::string v = common::to_lower(common::trim(std::string(value)));
  if (v == "create") {
    return OperationKind::Create;
  }
  if (v == "update") {
    return OperationKind::Update;
  }
  if (v == "delete") {
    return OperationKind::Delete;
  }
  return std::nullopt;
}

std::string_view skip_reason_name(const SkipReason reason) {
  switch (reason) {
  case SkipReason::Size:
    return "SKIP_SIZE";
  case SkipReason::Structural:
    return "SKIP_STRUCTURAL";
  case SkipReason::NonPersonal:
    return "SKIP_NON_PERSONAL";
  case SkipReason::Technical:
    return "SKIP_TECHNICAL";
  case SkipReason::Instruction:
    return "SKIP_INSTRUCTION";
  case SkipReason::Arithmetic:
    return "SKIP_ARITHMETIC";
  case SkipReason::Translation:
    return "SKIP_TRANSLATION";
  case SkipReason::Grammar:
    return "SKIP_GRAMMAR";
  }
  return "SKIP_NON_PERSONAL";
}

std::string skip_reason_message(const SkipReason reason) {
  switch (reason) {
  case SkipReason::Size:
    return "Message length outside limits, skipping memory operations";
  case SkipReason::Structural:
    return "Structured or technical content detected, skipping memory operations";
  case SkipReason::NonPersonal:
    return "Non-personal content detected, skipping memory operations";
  case SkipReason::Technical:
    return "Technical content detected, skipping memory operations";
  case SkipReason::Instruction:
    return "Formatting or rewrite instruction detected, skipping memory operations";
  case SkipReason::Arithmetic:
    return "Calculation request detected, skipping memory operations";
  case SkipReason::Translation:
    return "Translation request detected, skipping memory operations";
  case SkipReason::Grammar:
    return "Proofreading request detected, skipping memory operations";
  }
  return "Skipping memory operations";
}

} // namespace mnemo::memory
