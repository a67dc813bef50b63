#include "pg_lock_store.hpp"

#include "pg_repository.hpp"

namespace docflow::db::postgres {

PgLockStore::PgLockStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

Result PgLockStore::TryInsert(const lock::LockRecord& record, std::uint64_t stale_before_ms) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work w(*conn);
    auto res = w.exec_prepared("lock_try_insert", record.lock_key, record.region, record.holder_id, record.created_at_ms, stale_before_ms);
    w.commit();

    // ON CONFLICT ... WHERE: a live row leaves zero affected rows
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::Conflict, record.lock_key + " is held");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return PgRepository::Translate(e);
  }
}

Result PgLockStore::Delete(const std::string& lock_key, const std::string& region, const std::string& holder_id) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work w(*conn);
    w.exec_prepared("lock_delete", lock_key, region, holder_id);
    w.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return PgRepository::Translate(e);
  }
}

std::optional<lock::LockRecord> PgLockStore::Get(const std::string& lock_key, const std::string& region) {
  auto       conn = pool_->Acquire();
  pqxx::work w(*conn);
  auto       res = w.exec_prepared("lock_get", lock_key, region);
  w.commit();
  if (res.empty()) return std::nullopt;

  lock::LockRecord r;
  r.lock_key      = res[0][0].c_str();
  r.region        = res[0][1].c_str();
  r.holder_id     = res[0][2].c_str();
  r.created_at_ms = res[0][3].as<std::uint64_t>();
  return r;
}

Result PgLockStore::ReapExpired(const std::string& region, std::uint64_t stale_before_ms, std::uint64_t* reaped) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work w(*conn);
    auto       res = w.exec_prepared("lock_reap", region, stale_before_ms);
    w.commit();
    if (reaped) *reaped = static_cast<std::uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return PgRepository::Translate(e);
  }
}

} // namespace docflow::db::postgres
