#pragma once

#include "mnemo/providers/traits.hpp"

#include <memory>
#include <vector>

namespace mnemo::providers {

/// Retries a primary client with exponential backoff, then tries each fallback the same way.
/// Validation and auth failures are returned immediately.
class ReliableCompletionClient final : public ICompletionClient {
public:
  ReliableCompletionClient(std::shared_ptr<ICompletionClient> primary,
                           std::vector<std::shared_ptr<ICompletionClient>> fallbacks,
                           std::uint32_t max_retries, std::uint64_t backoff_ms);

  [[nodiscard]] common::Result<std::string> complete(const CompletionRequest &request) override;
  [[nodiscard]] std::string name() const override;

private:
  [[nodiscard]] common::Result<std::string>
  execute_with_client(const std::shared_ptr<ICompletionClient> &client,
                      const CompletionRequest &request) const;

  std::shared_ptr<ICompletionClient> primary_;
  std::vector<std::shared_ptr<ICompletionClient>> fallbacks_;
  std::uint32_t max_retries_;
  std::uint64_t backoff_ms_;
};

} // namespace mnemo::providers
