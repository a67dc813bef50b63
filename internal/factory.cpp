#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/config/runtime_options.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/workflow_server.hpp"
#include "internal/lock/memory_lock_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/workflow_service.hpp"
#if DOCFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_lock_store.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if DOCFLOW_DB_POSTGRES
#include "internal/db/postgres/pg_lock_store.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace docflow::factory {

using namespace docflow;
using observability::StringField;

namespace {

struct Storage {
  std::shared_ptr<db::Repository>  repository;
  std::shared_ptr<lock::LockStore> lock_store;
};

#if DOCFLOW_DB_SQLITE
std::shared_ptr<db::sqlite::SqliteDB> OpenSqlite(const docflow::runtime::config::DatabaseConfig::SqliteConfig& config) {
  db::sqlite::SqliteOptions options;
  options.wal_mode = config.wal_mode();

  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(config.path(), options);
  sqlite_db->ApplySchema(db::sql::SqliteSchema());
  return sqlite_db;
}
#endif

Storage BuildStorage(const docflow::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DOCFLOW_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
    }
    // lock rows need their own autocommit connection
    auto business = OpenSqlite(database.sqlite());
    auto locking  = OpenSqlite(database.sqlite());
    DOCFLOW_LOG_INFO("using sqlite backend", {StringField("path", database.sqlite().path())});
    return {std::make_shared<db::sqlite::SqliteRepository>(std::move(business)), std::make_shared<db::sqlite::SqliteLockStore>(std::move(locking))};
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DOCFLOW_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->ApplySchema(db::sql::PostgresSchema());
    DOCFLOW_LOG_INFO("using postgres backend");
    return {std::make_shared<db::postgres::PgRepository>(pool), std::make_shared<db::postgres::PgLockStore>(pool)};
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  DOCFLOW_LOG_WARN("no database configured; using in-memory storage, nothing survives a restart");
  return {std::make_shared<db::memory::MemoryRepository>(), std::make_shared<lock::MemoryLockStore>()};
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const docflow::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage backends
  // ------------------------------------------------------------------
  auto storage   = BuildStorage(config);
  app.repository = storage.repository;
  app.lock_store = storage.lock_store;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const auto lock_options = config::ToLockOptions(config.locks());
  app.locks               = std::make_shared<lock::LockService>(app.lock_store, lock_options);
  app.quotations          = std::make_shared<core::QuotationService>(app.repository, app.locks);
  app.orchestrator        = std::make_shared<core::WorkflowOrchestrator>(app.repository, app.locks, config::ToWorkflowOptions(config.workflow()));

  // ------------------------------------------------------------------
  // Lock reaper
  // ------------------------------------------------------------------
  app.lock_reaper = std::make_shared<lock::LockReaper>(app.lock_store, lock_options, config::ReaperInterval(config.locks()));
  app.lock_reaper->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.orchestrator = app.orchestrator;
  ctx.quotations   = app.quotations;
  ctx.repository   = app.repository;

  auto workflow_service = std::make_shared<service::WorkflowService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::WorkflowServer>(workflow_service));

  return app;
}

} // namespace docflow::factory
