#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace docflow::db::sqlite {

struct SqliteOptions {
  // WAL keeps the lock connection writable while a business transaction
  // is open; false falls back to a rollback journal (DELETE).
  bool wal_mode = true;

  std::chrono::milliseconds busy_timeout{5000};
};

/*
  One sqlite3 connection plus the slot that serializes its transactions.

  docflow opens two of these on the same file: one for repository
  transactions and one for lock rows, which must commit on their own
  while a business transaction is still open. Both run ApplySchema;
  the DDL is idempotent.

  Failures surface as util::StorageError; SQLITE_BUSY and SQLITE_LOCKED
  are marked busy.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  const SqliteOptions& Options() const {
    return options_;
  }

  // Held by SqliteTransaction from BEGIN to COMMIT/ROLLBACK.
  std::timed_mutex& TransactionMutex() {
    return tx_mutex_;
  }

  void          Exec(const std::string& sql);
  sqlite3_stmt* Prepare(const std::string& sql);

  // Runs every statement inside one transaction.
  void ApplySchema(const std::vector<std::string>& statements);

  // "wal", "delete", "memory", ... as reported by the connection.
  std::string JournalMode();

 private:
  void Configure();

  sqlite3*         db_ = nullptr;
  std::string      path_;
  SqliteOptions    options_;
  std::timed_mutex tx_mutex_;
};

} // namespace docflow::db::sqlite
