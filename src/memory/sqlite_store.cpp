#include "mnemo/memory/sqlite_store.hpp"

#include "mnemo/common/text.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <sstream>

namespace mnemo::memory {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorKind::StoreFailure, msg);
  }
  return common::Status::success();
}

common::Result<std::string> random_id() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    return common::Result<std::string>::failure(common::ErrorKind::StoreFailure,
                                                "RAND_bytes failed");
  }
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char b : bytes) {
    stream << std::setw(2) << static_cast<int>(b);
  }
  return common::Result<std::string>::success(stream.str());
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : reinterpret_cast<const char *>(text);
}

/// Finalizes a prepared statement on scope exit.
class Statement {
public:
  Statement(sqlite3 *db, const char *sql) { rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr); }
  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }
  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool ok() const { return rc_ == SQLITE_OK; }
  [[nodiscard]] sqlite3_stmt *get() const { return stmt_; }
  void bind(const int index, const std::string &value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
  }

private:
  sqlite3_stmt *stmt_ = nullptr;
  int rc_ = SQLITE_ERROR;
};

} // namespace

/// Holds the store lock and arms a progress-handler deadline for one call.
class SqliteMemoryStore::DeadlineGuard {
public:
  DeadlineGuard(SqliteMemoryStore &store, const std::chrono::milliseconds timeout)
      : store_(store), deadline_(std::chrono::steady_clock::now() + timeout),
        lock_(store.mutex_, std::defer_lock) {
    locked_ = lock_.try_lock_for(timeout);
    if (locked_ && store_.db_ != nullptr) {
      const auto ms = std::max<long long>(1, timeout.count());
      sqlite3_busy_timeout(store_.db_, static_cast<int>(std::min<long long>(ms, 1'000'000)));
      sqlite3_progress_handler(store_.db_, 1000, &DeadlineGuard::on_progress, this);
    }
  }

  ~DeadlineGuard() {
    if (locked_ && store_.db_ != nullptr) {
      sqlite3_progress_handler(store_.db_, 0, nullptr, nullptr);
    }
  }

  DeadlineGuard(const DeadlineGuard &) = delete;
  DeadlineGuard &operator=(const DeadlineGuard &) = delete;

  [[nodiscard]] common::Status check() const {
    if (!locked_) {
      return common::Status::error(common::ErrorKind::Timeout, "timed out waiting for store lock");
    }
    if (store_.db_ == nullptr) {
      return common::Status::error(common::ErrorKind::StoreFailure, "database not initialized");
    }
    return common::Status::success();
  }

private:
  static int on_progress(void *self) {
    const auto *guard = static_cast<DeadlineGuard *>(self);
    return std::chrono::steady_clock::now() > guard->deadline_ ? 1 : 0;
  }

  SqliteMemoryStore &store_;
  std::chrono::steady_clock::time_point deadline_;
  std::unique_lock<std::timed_mutex> lock_;
  bool locked_ = false;
};

SqliteMemoryStore::SqliteMemoryStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {}

SqliteMemoryStore::~SqliteMemoryStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

std::string_view SqliteMemoryStore::name() const { return "sqlite"; }

common::Status SqliteMemoryStore::open() {
  std::lock_guard<std::timed_mutex> lock(mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
  }

  if (db_path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path_.parent_path(), ec);
    if (ec) {
      return common::Status::error(common::ErrorKind::StoreFailure,
                                   "cannot create store directory: " + ec.message());
    }
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    const std::string message = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    return common::Status::error(common::ErrorKind::StoreFailure, message);
  }

  auto status = init_schema();
  if (!status.ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
  return status;
}

common::Status SqliteMemoryStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS memories (
  id TEXT PRIMARY KEY,
  user_id TEXT NOT NULL,
  content TEXT NOT NULL,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, "CREATE INDEX IF NOT EXISTS idx_memories_user ON memories(user_id);");
}

common::Status SqliteMemoryStore::step_error(const char *operation, const int rc) const {
  if (rc == SQLITE_INTERRUPT || rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    return common::Status::error(common::ErrorKind::Timeout,
                                 std::string(operation) + " exceeded its deadline");
  }
  return common::Status::error(common::ErrorKind::StoreFailure,
                               std::string(operation) + ": " + sqlite3_errmsg(db_));
}

common::Result<std::vector<MemoryRecord>>
SqliteMemoryStore::list_by_user(const std::string &user_id, const std::chrono::milliseconds timeout) {
  using ListResult = common::Result<std::vector<MemoryRecord>>;
  DeadlineGuard guard(*this, timeout);
  if (const auto status = guard.check(); !status.ok()) {
    return ListResult::failure(status);
  }

  Statement stmt(db_, "SELECT id, user_id, content, created_at, updated_at FROM memories "
                      "WHERE user_id = ?1 ORDER BY created_at ASC, id ASC");
  if (!stmt.ok()) {
    return ListResult::failure(common::ErrorKind::StoreFailure, sqlite3_errmsg(db_));
  }
  stmt.bind(1, user_id);

  std::vector<MemoryRecord> records;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    records.push_back(MemoryRecord{.id = column_text(stmt.get(), 0),
                                   .user_id = column_text(stmt.get(), 1),
                                   .content = column_text(stmt.get(), 2),
                                   .created_at = column_text(stmt.get(), 3),
                                   .updated_at = column_text(stmt.get(), 4)});
  }
  if (rc != SQLITE_DONE) {
    return ListResult::failure(step_error("list_by_user", rc));
  }
  return ListResult::success(std::move(records));
}

common::Result<std::string> SqliteMemoryStore::create(const std::string &user_id,
                                                      const std::string &content,
                                                      const std::chrono::milliseconds timeout) {
  DeadlineGuard guard(*this, timeout);
  if (const auto status = guard.check(); !status.ok()) {
    return common::Result<std::string>::failure(status);
  }

  auto id = random_id();
  if (!id.ok()) {
    return id;
  }

  Statement stmt(db_, "INSERT INTO memories(id, user_id, content, created_at, updated_at) "
                      "VALUES(?1, ?2, ?3, ?4, ?4)");
  if (!stmt.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::StoreFailure,
                                                sqlite3_errmsg(db_));
  }
  const std::string now = common::now_rfc3339();
  stmt.bind(1, id.value());
  stmt.bind(2, user_id);
  stmt.bind(3, content);
  stmt.bind(4, now);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return common::Result<std::string>::failure(step_error("create", rc));
  }
  return id;
}

common::Status SqliteMemoryStore::update(const std::string &id, const std::string &user_id,
                                         const std::string &content,
                                         const std::chrono::milliseconds timeout) {
  DeadlineGuard guard(*this, timeout);
  if (auto status = guard.check(); !status.ok()) {
    return status;
  }

  Statement stmt(db_, "UPDATE memories SET content = ?1, updated_at = ?2 "
                      "WHERE id = ?3 AND user_id = ?4");
  if (!stmt.ok()) {
    return common::Status::error(common::ErrorKind::StoreFailure, sqlite3_errmsg(db_));
  }
  stmt.bind(1, content);
  stmt.bind(2, common::now_rfc3339());
  stmt.bind(3, id);
  stmt.bind(4, user_id);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return step_error("update", rc);
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error(common::ErrorKind::StoreFailure, "memory not found: " + id);
  }
  return common::Status::success();
}

common::Status SqliteMemoryStore::remove(const std::string &id, const std::string &user_id,
                                         const std::chrono::milliseconds timeout) {
  DeadlineGuard guard(*this, timeout);
  if (auto status = guard.check(); !status.ok()) {
    return status;
  }

  Statement stmt(db_, "DELETE FROM memories WHERE id = ?1 AND user_id = ?2");
  if (!stmt.ok()) {
    return common::Status::error(common::ErrorKind::StoreFailure, sqlite3_errmsg(db_));
  }
  stmt.bind(1, id);
  stmt.bind(2, user_id);

  const int rc = sqlite3_step(stmt.get());
  if (rc != SQLITE_DONE) {
    return step_error("remove", rc);
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error(common::ErrorKind::StoreFailure, "memory not found: " + id);
  }
  return common::Status::success();
}

common::Result<std::size_t> SqliteMemoryStore::count() {
  std::lock_guard<std::timed_mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure(common::ErrorKind::StoreFailure,
                                                "database not initialized");
  }
  Statement stmt(db_, "SELECT COUNT(*) FROM memories");
  if (!stmt.ok() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return common::Result<std::size_t>::failure(common::ErrorKind::StoreFailure,
                                                sqlite3_errmsg(db_));
  }
  return common::Result<std::size_t>::success(
      static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0)));
}

common::Result<std::shared_ptr<IMemoryStore>> create_memory_store(const config::Config &config) {
  using StoreResult = common::Result<std::shared_ptr<IMemoryStore>>;
  const std::string backend = common::to_lower(config.store.backend);
  if (backend != "sqlite") {
    return StoreResult::failure(common::ErrorKind::Unsupported,
                                "unsupported store backend: " + config.store.backend);
  }
  auto store = std::make_shared<SqliteMemoryStore>(common::expand_path(config.store.path));
  if (auto status = store->open(); !status.ok()) {
    return StoreResult::failure(status);
  }
  return StoreResult::success(std::move(store));
}

} // namespace mnemo::memory
