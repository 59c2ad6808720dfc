#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace mnemo::cache {

enum class CacheKind : std::uint8_t {
  Embedding,
  Retrieval,
  MemoryList,
  Verdict,
};

inline constexpr std::size_t kCacheKindCount = 4;

[[nodiscard]] inline std::string_view cache_kind_name(const CacheKind kind) {
  switch (kind) {
  case CacheKind::Embedding:
    return "embedding";
  case CacheKind::Retrieval:
    return "retrieval";
  case CacheKind::MemoryList:
    return "memory";
  case CacheKind::Verdict:
    return "verdict";
  }
  return "unknown";
}

struct CacheLimits {
  std::size_t max_users = 50;
  std::size_t default_capacity = 500;
  /// Per-kind overrides; zero means "use default_capacity".
  std::array<std::size_t, kCacheKindCount> per_kind{};

  [[nodiscard]] std::size_t capacity(const CacheKind kind) const {
    const auto override_value = per_kind[static_cast<std::size_t>(kind)];
    return override_value == 0 ? default_capacity : override_value;
  }
};

struct CacheStats {
  std::size_t users = 0;
  std::size_t entries = 0;
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t evictions = 0;
};

/// Called with (user, kind) for a single evicted key, or (user, nullopt) for an evicted user.
using EvictionCallback =
    std::function<void(const std::string &user, std::optional<CacheKind> kind)>;

/// Two-level LRU: users -> kind -> key -> value. Every operation runs under one mutex and is
/// O(1) amortized. Has no knowledge of what it stores.
template <typename Value> class CacheManager {
public:
  explicit CacheManager(CacheLimits limits = {}, EvictionCallback on_evict = {})
      : limits_(limits), on_evict_(std::move(on_evict)) {
    if (limits_.max_users == 0) {
      limits_.max_users = 1;
    }
    if (limits_.default_capacity == 0) {
      limits_.default_capacity = 1;
    }
  }

  CacheManager(const CacheManager &) = delete;
  CacheManager &operator=(const CacheManager &) = delete;

  [[nodiscard]] std::optional<Value> get(const std::string &user, const CacheKind kind,
                                         const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto user_it = users_.find(user);
    if (user_it == users_.end()) {
      ++stats_.misses;
      return std::nullopt;
    }
    auto &bucket = user_it->second.kinds[index(kind)];
    const auto entry_it = bucket.index.find(key);
    if (entry_it == bucket.index.end()) {
      ++stats_.misses;
      return std::nullopt;
    }
    bucket.order.splice(bucket.order.end(), bucket.order, entry_it->second);
    touch_user(user_it->second);
    ++stats_.hits;
    return entry_it->second->second;
  }

  void put(const std::string &user, const CacheKind kind, const std::string &key, Value value) {
    std::optional<std::pair<std::string, std::optional<CacheKind>>> evicted_user;
    std::optional<std::pair<std::string, std::optional<CacheKind>>> evicted_entry;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto user_it = users_.find(user);
      if (user_it == users_.end()) {
        if (users_.size() >= limits_.max_users && !user_order_.empty()) {
          const std::string oldest = user_order_.front();
          const auto oldest_it = users_.find(oldest);
          stats_.entries -= oldest_it->second.size();
          user_order_.pop_front();
          users_.erase(oldest_it);
          ++stats_.evictions;
          evicted_user.emplace(oldest, std::nullopt);
        }
        user_order_.push_back(user);
        UserSet fresh;
        fresh.position = std::prev(user_order_.end());
        user_it = users_.emplace(user, std::move(fresh)).first;
      } else {
        touch_user(user_it->second);
      }

      auto &bucket = user_it->second.kinds[index(kind)];
      if (const auto entry_it = bucket.index.find(key); entry_it != bucket.index.end()) {
        entry_it->second->second = std::move(value);
        bucket.order.splice(bucket.order.end(), bucket.order, entry_it->second);
      } else {
        if (bucket.order.size() >= limits_.capacity(kind)) {
          bucket.index.erase(bucket.order.front().first);
          bucket.order.pop_front();
          --stats_.entries;
          ++stats_.evictions;
          evicted_entry.emplace(user, kind);
        }
        bucket.order.emplace_back(key, std::move(value));
        bucket.index.emplace(key, std::prev(bucket.order.end()));
        ++stats_.entries;
      }
    }
    // Callbacks run outside the lock so they may log or read the cache.
    if (on_evict_) {
      if (evicted_user.has_value()) {
        on_evict_(evicted_user->first, evicted_user->second);
      }
      if (evicted_entry.has_value()) {
        on_evict_(evicted_entry->first, evicted_entry->second);
      }
    }
  }

  /// Removes one kind (or every kind) for a user and returns the number of entries dropped.
  std::size_t clear_user_cache(const std::string &user,
                               const std::optional<CacheKind> kind = std::nullopt) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto user_it = users_.find(user);
    if (user_it == users_.end()) {
      return 0;
    }
    std::size_t removed = 0;
    if (kind.has_value()) {
      auto &bucket = user_it->second.kinds[index(*kind)];
      removed = bucket.order.size();
      bucket.order.clear();
      bucket.index.clear();
    } else {
      removed = user_it->second.size();
    }
    stats_.entries -= removed;
    if (!kind.has_value() || user_it->second.size() == 0) {
      user_order_.erase(user_it->second.position);
      users_.erase(user_it);
    }
    return removed;
  }

  void clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    users_.clear();
    user_order_.clear();
    stats_.entries = 0;
  }

  [[nodiscard]] std::size_t user_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.size();
  }

  [[nodiscard]] std::size_t entry_count(const std::string &user, const CacheKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto user_it = users_.find(user);
    if (user_it == users_.end()) {
      return 0;
    }
    return user_it->second.kinds[index(kind)].order.size();
  }

  [[nodiscard]] bool contains_user(const std::string &user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_.contains(user);
  }

  [[nodiscard]] CacheStats stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats out = stats_;
    out.users = users_.size();
    return out;
  }

  [[nodiscard]] const CacheLimits &limits() const { return limits_; }

private:
  using EntryList = std::list<std::pair<std::string, Value>>;

  struct KindBucket {
    EntryList order;
    std::unordered_map<std::string, typename EntryList::iterator> index;
  };

  struct UserSet {
    std::array<KindBucket, kCacheKindCount> kinds;
    std::list<std::string>::iterator position;

    [[nodiscard]] std::size_t size() const {
      std::size_t total = 0;
      for (const auto &bucket : kinds) {
        total += bucket.order.size();
      }
      return total;
    }
  };

  static std::size_t index(const CacheKind kind) { return static_cast<std::size_t>(kind); }

  void touch_user(UserSet &set) {
    user_order_.splice(user_order_.end(), user_order_, set.position);
  }

  CacheLimits limits_;
  EvictionCallback on_evict_;
  mutable std::mutex mutex_;
  // Front is least recently used.
  std::list<std::string> user_order_;
  std::unordered_map<std::string, UserSet> users_;
  CacheStats stats_;
};

/// `<kind>_<user>:<first 10 hex chars of sha256(content)>`, or `<kind>_<user>` without content.
[[nodiscard]] std::string make_cache_key(CacheKind kind, const std::string &user,
                                         std::string_view content = {});

} // namespace mnemo::cache
