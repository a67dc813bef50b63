#include "pg_tx.hpp"

#include <string>

#include "internal/db/postgres/pg_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace docflow::db::postgres {

using observability::StringField;

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()), work_(std::make_unique<pqxx::work>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (finished_) {
    return;
  }
  try {
    work_->abort();
  } catch (const std::exception& e) {
    DOCFLOW_LOG_WARN("postgres rollback failed", {StringField("error", e.what())});
  } catch (...) {
    DOCFLOW_LOG_WARN("postgres rollback failed with a non-standard exception");
  }
}

void PgTransaction::Commit() {
  // pqxx refuses a second commit or abort either way
  finished_ = true;
  try {
    work_->commit();
  } catch (const pqxx::in_doubt_error& e) {
    throw util::StorageError(std::string("postgres commit outcome unknown: ") + e.what(), false);
  } catch (const std::exception& e) {
    const auto r = PgRepository::Translate(e);
    throw util::StorageError("postgres commit: " + r.message, r.code == ErrorCode::SerializationFailure || r.code == ErrorCode::Busy);
  }
}

void PgTransaction::Rollback() {
  finished_ = true;
  work_->abort();
}

} // namespace docflow::db::postgres
