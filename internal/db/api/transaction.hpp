#pragma once

namespace docflow::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE on the shared connection
  Postgres: pqxx::work on a pooled connection
  Memory: private snapshot + replayed write log

  Transactions give atomicity of a single workflow write. Races between
  writers on the same quotation are prevented by the quotation lock, not
  by transaction isolation.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

}
