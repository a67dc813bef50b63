#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace docflow::db::postgres {

/*
  PgPool

  Bounded connection pool shared by PgRepository and PgLockStore.

  - Each transaction borrows its own connection; libpqxx connections are
    not thread-safe and are never shared while borrowed.
  - Prepared statements are installed once per connection.
  - Acquire blocks while max_connections are all borrowed.

  Lifetime:
    Repository / lock store own shared_ptr<PgPool>
    A borrowed shared_ptr<pqxx::connection> returns itself on release
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

  // Runs the idempotent schema bootstrap on a fresh transaction.
  void ApplySchema(const std::vector<std::string>& statements);

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace docflow::db::postgres
