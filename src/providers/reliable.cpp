#include "mnemo/providers/reliable.hpp"

#include <chrono>
#include <thread>

namespace mnemo::providers {

namespace {

bool is_retryable(const common::Result<std::string> &result) {
  if (result.kind() == common::ErrorKind::ValidationFailure) {
    return false;
  }
  return result.error().find("[auth]") == std::string::npos;
}

} // namespace

ReliableCompletionClient::ReliableCompletionClient(
    std::shared_ptr<ICompletionClient> primary,
    std::vector<std::shared_ptr<ICompletionClient>> fallbacks, const std::uint32_t max_retries,
    const std::uint64_t backoff_ms)
    : primary_(std::move(primary)), fallbacks_(std::move(fallbacks)), max_retries_(max_retries),
      backoff_ms_(backoff_ms) {}

common::Result<std::string>
ReliableCompletionClient::execute_with_client(const std::shared_ptr<ICompletionClient> &client,
                                              const CompletionRequest &request) const {
  auto result = common::Result<std::string>::failure("no attempt made");
  for (std::uint32_t attempt = 0; attempt <= max_retries_; ++attempt) {
    result = client->complete(request);
    if (result.ok() || !is_retryable(result)) {
      return result;
    }
    if (attempt < max_retries_) {
      const std::uint64_t delay = backoff_ms_ * (1ULL << attempt);
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    }
  }
  return result;
}

common::Result<std::string> ReliableCompletionClient::complete(const CompletionRequest &request) {
  auto result = execute_with_client(primary_, request);
  if (result.ok() || !is_retryable(result)) {
    return result;
  }

  for (const auto &fallback : fallbacks_) {
    if (!fallback) {
      continue;
    }
    result = execute_with_client(fallback, request);
    if (result.ok()) {
      return result;
    }
  }
  return result;
}

std::string ReliableCompletionClient::name() const { return "reliable(" + primary_->name() + ")"; }

} // namespace mnemo::providers
