#pragma once

#include <memory>

#include "internal/lock/lock_store.hpp"
#include "pg_pool.hpp"

namespace docflow::db::postgres {

/*
  Lock rows in PostgreSQL, shared by every server pointed at the same
  database. Each call runs and commits its own short transaction so a
  claimed row is visible to other instances immediately.
*/
class PgLockStore final : public lock::LockStore {
 public:
  explicit PgLockStore(std::shared_ptr<PgPool> pool);

  Result                          TryInsert(const lock::LockRecord& record, std::uint64_t stale_before_ms) override;
  Result                          Delete(const std::string& lock_key, const std::string& region, const std::string& holder_id) override;
  std::optional<lock::LockRecord> Get(const std::string& lock_key, const std::string& region) override;
  Result                          ReapExpired(const std::string& region, std::uint64_t stale_before_ms, std::uint64_t* reaped) override;

 private:
  std::shared_ptr<PgPool> pool_;
};

} // namespace docflow::db::postgres
