#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace mnemo::memory {

/// Cooperative stop signal, checked by background work between stages.
class CancellationToken {
public:
  void cancel() { cancelled_.store(true); }
  [[nodiscard]] bool cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

/// Live set of background tasks. Each task runs on its own std::async thread; when it finishes
/// it logs any escaped exception and marks itself for removal. Finished futures are reaped on
/// the next submit or wait.
class BackgroundTaskRegistry {
public:
  using Task = std::function<void(const CancellationToken &)>;

  BackgroundTaskRegistry();
  ~BackgroundTaskRegistry();

  BackgroundTaskRegistry(const BackgroundTaskRegistry &) = delete;
  BackgroundTaskRegistry &operator=(const BackgroundTaskRegistry &) = delete;

  /// Returns false once shutdown has begun.
  bool submit(std::string label, Task task);

  [[nodiscard]] std::size_t active_count() const;
  [[nodiscard]] bool accepting() const;

  /// Blocks until every submitted task has finished.
  void wait_all();
  /// Cancels the shared token, refuses new tasks and waits for running ones.
  void shutdown();

private:
  void reap_finished();
  [[nodiscard]] std::size_t active_locked() const;

  mutable std::mutex mutex_;
  std::unordered_map<std::uint64_t, std::future<void>> tasks_;
  std::vector<std::uint64_t> finished_;
  std::uint64_t next_id_ = 1;
  bool accepting_ = true;
  std::shared_ptr<CancellationToken> token_;
};

} // namespace mnemo::memory
