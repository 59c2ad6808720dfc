#pragma once

#include "mnemo/memory/store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace mnemo::memory {

class SqliteMemoryStore final : public IMemoryStore {
public:
  explicit SqliteMemoryStore(std::filesystem::path db_path);
  ~SqliteMemoryStore() override;

  SqliteMemoryStore(const SqliteMemoryStore &) = delete;
  SqliteMemoryStore &operator=(const SqliteMemoryStore &) = delete;

  /// Opens the database and creates the schema; must succeed before any other call.
  [[nodiscard]] common::Status open();

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<MemoryRecord>>
  list_by_user(const std::string &user_id, std::chrono::milliseconds timeout) override;
  [[nodiscard]] common::Result<std::string> create(const std::string &user_id,
                                                   const std::string &content,
                                                   std::chrono::milliseconds timeout) override;
  [[nodiscard]] common::Status update(const std::string &id, const std::string &user_id,
                                      const std::string &content,
                                      std::chrono::milliseconds timeout) override;
  [[nodiscard]] common::Status remove(const std::string &id, const std::string &user_id,
                                      std::chrono::milliseconds timeout) override;

  [[nodiscard]] common::Result<std::size_t> count();

private:
  class DeadlineGuard;

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status step_error(const char *operation, int rc) const;

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  // Waiting for the lock counts against the caller's deadline.
  std::timed_mutex mutex_;
};

} // namespace mnemo::memory
