#include "sqlite_db.hpp"

#include <memory>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace docflow::db::sqlite {

using observability::StringField;

namespace {

bool IsBusy(int rc) {
  const int primary = rc & 0xff;
  return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

[[noreturn]] void Fail(int rc, const std::string& what, const std::string& detail) {
  throw util::StorageError("sqlite " + what + ": " + detail, IsBusy(rc));
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    Fail(rc, "open " + path_, detail);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::unique_ptr<char, decltype(&sqlite3_free)> owned(err, &sqlite3_free);
    Fail(rc, "exec", owned ? owned.get() : sqlite3_errstr(rc));
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  const int     rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    Fail(rc, "prepare", sqlite3_errmsg(db_));
  }
  return stmt;
}

void SqliteDB::ApplySchema(const std::vector<std::string>& statements) {
  std::unique_lock<std::timed_mutex> slot(tx_mutex_);
  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : statements) {
      Exec(sql);
    }
    Exec("COMMIT;");
  } catch (...) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

std::string SqliteDB::JournalMode() {
  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> st(Prepare("PRAGMA journal_mode;"), &sqlite3_finalize);
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    Fail(sqlite3_errcode(db_), "journal_mode", sqlite3_errmsg(db_));
  }
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 0));
  return text ? text : "";
}

void SqliteDB::Configure() {
  const int rc = sqlite3_busy_timeout(db_, static_cast<int>(options_.busy_timeout.count()));
  if (rc != SQLITE_OK) {
    Fail(rc, "busy_timeout", sqlite3_errmsg(db_));
  }

  Exec(options_.wal_mode ? "PRAGMA journal_mode=WAL;" : "PRAGMA journal_mode=DELETE;");
  if (options_.wal_mode && JournalMode() != "wal") {
    // in-memory databases cannot switch
    DOCFLOW_LOG_WARN("sqlite refused WAL; lock polling will wait behind writers",
                     {StringField("path", path_), StringField("journal_mode", JournalMode())});
  }

  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");
}

} // namespace docflow::db::sqlite
