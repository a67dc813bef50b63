#pragma once

#include <memory>
#include <mutex>

#include "internal/lock/lock_store.hpp"
#include "sqlite_db.hpp"

namespace docflow::db::sqlite {

/*
  Lock store backed by the docflow_lock table.

  Must be given its own SqliteDB (autocommit) so that lock rows are
  visible to other processes as soon as the statement finishes.
*/
class SqliteLockStore final : public lock::LockStore {
 public:
  explicit SqliteLockStore(std::shared_ptr<SqliteDB> db);

  Result TryInsert(const lock::LockRecord& record, std::uint64_t stale_before_ms) override;
  Result Delete(const std::string& lock_key, const std::string& region, const std::string& holder_id) override;
  std::optional<lock::LockRecord> Get(const std::string& lock_key, const std::string& region) override;
  Result ReapExpired(const std::string& region, std::uint64_t stale_before_ms, std::uint64_t* reaped) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  // keeps sqlite3_changes() attributable to the statement that just ran
  std::mutex mutex_;
};

} // namespace docflow::db::sqlite
