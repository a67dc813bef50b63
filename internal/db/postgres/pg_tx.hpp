#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace docflow::db::postgres {

/*
  One pqxx::work on a connection borrowed from PgPool for the
  transaction's lifetime. The connection goes back to the pool when the
  transaction is destroyed, after an abort if nothing was committed.

  Commit failures surface as util::StorageError. Serialization failures
  and deadlocks are marked busy; a connection lost mid-commit is not,
  since the outcome is unknown.
*/
class PgTransaction final : public db::Transaction {
 public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  PgTransaction(const PgTransaction&)            = delete;
  PgTransaction& operator=(const PgTransaction&) = delete;

  pqxx::work& Work() {
    return *work_;
  }

  void Commit() override;
  void Rollback() override;

  bool IsCommitted() const override {
    return finished_;
  }

 private:
  // declared first so it is released last
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  bool                              finished_ = false;
};

} // namespace docflow::db::postgres
