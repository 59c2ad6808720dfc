#pragma once

#include "mnemo/common/result.hpp"
#include "mnemo/config/schema.hpp"
#include "mnemo/memory/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mnemo::memory {

/// Durable per-user memory records. Every call carries its own deadline; exceeding it fails with
/// ErrorKind::Timeout, any other failure with ErrorKind::StoreFailure.
class IMemoryStore {
public:
  virtual ~IMemoryStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<MemoryRecord>>
  list_by_user(const std::string &user_id, std::chrono::milliseconds timeout) = 0;
  /// Returns the new record id.
  [[nodiscard]] virtual common::Result<std::string>
  create(const std::string &user_id, const std::string &content,
         std::chrono::milliseconds timeout) = 0;
  [[nodiscard]] virtual common::Status update(const std::string &id, const std::string &user_id,
                                              const std::string &content,
                                              std::chrono::milliseconds timeout) = 0;
  [[nodiscard]] virtual common::Status remove(const std::string &id, const std::string &user_id,
                                              std::chrono::milliseconds timeout) = 0;
};

[[nodiscard]] common::Result<std::shared_ptr<IMemoryStore>>
create_memory_store(const config::Config &config);

} // namespace mnemo::memory
