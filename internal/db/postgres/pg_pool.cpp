#include "pg_pool.hpp"

namespace docflow::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::ApplySchema(const std::vector<std::string>& statements) {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : statements) {
    tx.exec(sql);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("lock_try_insert",
               "INSERT INTO docflow_lock(lock_key,region,holder_id,created_at_ms) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(lock_key,region) DO UPDATE SET holder_id=EXCLUDED.holder_id, created_at_ms=EXCLUDED.created_at_ms "
               "WHERE docflow_lock.created_at_ms < $5");

  conn.prepare("lock_delete", "DELETE FROM docflow_lock WHERE lock_key=$1 AND region=$2 AND holder_id=$3");

  conn.prepare("lock_get", "SELECT lock_key,region,holder_id,created_at_ms FROM docflow_lock WHERE lock_key=$1 AND region=$2");

  conn.prepare("lock_reap", "DELETE FROM docflow_lock WHERE region=$1 AND created_at_ms < $2");

  conn.prepare("quotation_lines",
               "SELECT product_id, quantity::text, unit_price::text FROM quotation_line WHERE quotation_id=$1 ORDER BY line_no");

  conn.prepare("delivery_lines", "SELECT product_id, quantity::text FROM delivery_line WHERE delivery_id=$1 ORDER BY line_no");

  conn.prepare("invoice_lines",
               "SELECT product_id, quantity::text, unit_price::text, amount::text FROM invoice_line WHERE invoice_id=$1 ORDER BY line_no");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (!conn->is_open()) {
      delete conn;
      --live_connections_;
    } else {
      idle_.emplace_back(conn);
    }
  }
  cv_.notify_one();
}

} // namespace docflow::db::postgres
