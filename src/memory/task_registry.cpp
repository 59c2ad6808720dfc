#include "mnemo/memory/task_registry.hpp"

#include "mnemo/observability/global.hpp"

#include <exception>

namespace mnemo::memory {

BackgroundTaskRegistry::BackgroundTaskRegistry() : token_(std::make_shared<CancellationToken>()) {}

BackgroundTaskRegistry::~BackgroundTaskRegistry() { shutdown(); }

bool BackgroundTaskRegistry::submit(std::string label, Task task) {
  reap_finished();

  std::size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
      return false;
    }

    const std::uint64_t id = next_id_++;
    // The task thread needs mutex_ to report completion, so it cannot finish before its future is
    // stored below.
    auto future = std::async(std::launch::async, [this, id, label = std::move(label),
                                                  task = std::move(task), token = token_]() {
      try {
        task(*token);
      } catch (const std::exception &ex) {
        observability::record_error("tasks",
                                    "background task '" + label + "' failed: " + ex.what());
      }

      std::size_t remaining = 0;
      {
        std::lock_guard<std::mutex> done_lock(mutex_);
        finished_.push_back(id);
        remaining = active_locked();
      }
      observability::record_metric(
          observability::BackgroundTasksMetric{.count = static_cast<std::uint64_t>(remaining)});
    });
    tasks_.emplace(id, std::move(future));
    active = active_locked();
  }
  // Observers run outside mutex_ so they may query the registry.
  observability::record_metric(
      observability::BackgroundTasksMetric{.count = static_cast<std::uint64_t>(active)});
  return true;
}

std::size_t BackgroundTaskRegistry::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_locked();
}

std::size_t BackgroundTaskRegistry::active_locked() const {
  std::size_t done = 0;
  for (const auto id : finished_) {
    if (tasks_.contains(id)) {
      ++done;
    }
  }
  return tasks_.size() - done;
}

bool BackgroundTaskRegistry::accepting() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accepting_;
}

void BackgroundTaskRegistry::reap_finished() {
  std::vector<std::future<void>> done;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto id : finished_) {
      if (const auto it = tasks_.find(id); it != tasks_.end()) {
        done.push_back(std::move(it->second));
        tasks_.erase(it);
      }
    }
    finished_.clear();
  }
  // A finished task may still be unwinding its lambda; wait outside the lock.
  for (auto &future : done) {
    future.wait();
  }
}

void BackgroundTaskRegistry::wait_all() {
  while (true) {
    std::vector<std::future<void>> pending;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (tasks_.empty()) {
        finished_.clear();
        return;
      }
      for (auto &[id, future] : tasks_) {
        pending.push_back(std::move(future));
      }
      tasks_.clear();
    }
    for (auto &future : pending) {
      future.wait();
    }
  }
}

void BackgroundTaskRegistry::shutdown() {
  token_->cancel();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;
  }
  wait_all();
}

} // namespace mnemo::memory
