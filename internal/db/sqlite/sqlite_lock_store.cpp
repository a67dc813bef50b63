#include "sqlite_lock_store.hpp"

#include "sqlite_repository.hpp"

namespace docflow::db::sqlite {

namespace {

using Stmt = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// ON CONFLICT ... WHERE turns the stale-row takeover into part of the same
// atomic statement; a fresh row leaves changes() at 0.
constexpr const char* kTryInsert =
    "INSERT INTO docflow_lock(lock_key,region,holder_id,created_at_ms) VALUES(?,?,?,?) "
    "ON CONFLICT(lock_key,region) DO UPDATE SET holder_id=excluded.holder_id, created_at_ms=excluded.created_at_ms "
    "WHERE docflow_lock.created_at_ms < ?;";

constexpr const char* kDelete = "DELETE FROM docflow_lock WHERE lock_key=? AND region=? AND holder_id=?;";

constexpr const char* kSelect = "SELECT lock_key,region,holder_id,created_at_ms FROM docflow_lock WHERE lock_key=? AND region=?;";

constexpr const char* kReap = "DELETE FROM docflow_lock WHERE region=? AND created_at_ms < ?;";

} // namespace

SqliteLockStore::SqliteLockStore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

Result SqliteLockStore::TryInsert(const lock::LockRecord& record, std::uint64_t stale_before_ms) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, kTryInsert, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw, &sqlite3_finalize);

  BindText(st.get(), 1, record.lock_key);
  BindText(st.get(), 2, record.region);
  BindText(st.get(), 3, record.holder_id);
  BindU64(st.get(), 4, record.created_at_ms);
  BindU64(st.get(), 5, stale_before_ms);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    return SqliteRepository::Translate(db, rc);
  }
  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::Conflict, record.lock_key + " is held");
  }
  return Result::Ok();
}

Result SqliteLockStore::Delete(const std::string& lock_key, const std::string& region, const std::string& holder_id) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, kDelete, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw, &sqlite3_finalize);

  BindText(st.get(), 1, lock_key);
  BindText(st.get(), 2, region);
  BindText(st.get(), 3, holder_id);

  return SqliteRepository::Translate(db, sqlite3_step(st.get()));
}

std::optional<lock::LockRecord> SqliteLockStore::Get(const std::string& lock_key, const std::string& region) {
  std::lock_guard lock(mutex_);

  Stmt st(db_->Prepare(kSelect), &sqlite3_finalize);
  BindText(st.get(), 1, lock_key);
  BindText(st.get(), 2, region);

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    return std::nullopt;
  }

  lock::LockRecord r;
  r.lock_key      = reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 0));
  r.region        = reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 1));
  r.holder_id     = reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 2));
  r.created_at_ms = static_cast<std::uint64_t>(sqlite3_column_int64(st.get(), 3));
  return r;
}

Result SqliteLockStore::ReapExpired(const std::string& region, std::uint64_t stale_before_ms, std::uint64_t* reaped) {
  std::lock_guard lock(mutex_);
  auto*           db = db_->Handle();

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, kReap, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  Stmt st(raw, &sqlite3_finalize);

  BindText(st.get(), 1, region);
  BindU64(st.get(), 2, stale_before_ms);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    return SqliteRepository::Translate(db, rc);
  }
  if (reaped) *reaped = static_cast<std::uint64_t>(sqlite3_changes(db));
  return Result::Ok();
}

} // namespace docflow::db::sqlite
