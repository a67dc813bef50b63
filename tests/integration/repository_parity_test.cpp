#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/util/time.hpp"

#if DOCFLOW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if DOCFLOW_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using docflow::db::Repository;
using docflow::db::memory::MemoryRepository;
using docflow::db::model::DeliveryRecord;
using docflow::db::model::InvoiceLineRecord;
using docflow::db::model::InvoiceRecord;
using docflow::db::model::MovementLineRecord;
using docflow::db::model::PaymentRecord;
using docflow::db::model::QuotationLineRecord;
using docflow::db::model::QuotationRecord;
using docflow::model::MovementStatus;
using docflow::model::QuotationStatus;
using docflow::util::Decimal;
using docflow::util::ParseDate;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

// Each suite run gets its own project ids so reruns against a shared
// Postgres database do not collide on (project_id, version).
std::uint64_t NextProjectId() {
  static std::uint64_t next = NowMs() * 10;
  return ++next;
}

QuotationRecord MakeQuotation(std::uint64_t project_id, std::uint32_t version, QuotationStatus status) {
  QuotationRecord q;
  q.project_id    = project_id;
  q.version       = version;
  q.status        = status;
  q.lines         = {QuotationLineRecord{"P1", Decimal::Parse("100"), Decimal::Parse("12.50")},
                     QuotationLineRecord{"P2", Decimal::Parse("0.01"), Decimal::Parse("3")}};
  q.total_amount  = Decimal::Parse("1250.03");
  q.created_at_ms = NowMs();
  q.updated_at_ms = q.created_at_ms;
  return q;
}

void VerifyQuotationReadWrite(Repository& repo) {
  const auto project_id = NextProjectId();

  auto tx = repo.Begin();
  assert(!repo.GetLatestQuotationVersion(*tx, project_id).has_value());

  auto q = MakeQuotation(project_id, 1, QuotationStatus::kDraft);
  assert(repo.InsertQuotation(*tx, q));
  assert(q.id != 0);

  auto read = repo.GetQuotation(*tx, q.id);
  assert(read.has_value());
  assert(read->version == 1);
  assert(read->status == QuotationStatus::kDraft);
  assert(read->lines.size() == 2);
  assert(read->lines[0].product_id == "P1");
  assert(read->lines[1].quantity == Decimal::Parse("0.01"));
  assert(read->lines[0].unit_price == Decimal::Parse("12.50"));
  assert(read->total_amount == Decimal::Parse("1250.03"));

  read->status = QuotationStatus::kPending;
  read->lines  = {QuotationLineRecord{"P3", Decimal::Parse("7"), Decimal::Parse("1")}};
  assert(repo.UpdateQuotation(*tx, *read));

  auto updated = repo.GetQuotation(*tx, q.id);
  assert(updated->status == QuotationStatus::kPending);
  assert(updated->lines.size() == 1);
  assert(updated->lines[0].product_id == "P3");

  assert(repo.GetLatestQuotationVersion(*tx, project_id) == 1u);
  tx->Commit();
}

void VerifyLatestApprovedSelection(Repository& repo) {
  const auto project_id = NextProjectId();

  auto tx = repo.Begin();
  auto v1 = MakeQuotation(project_id, 1, QuotationStatus::kApproved);
  auto v2 = MakeQuotation(project_id, 2, QuotationStatus::kSent);
  auto v3 = MakeQuotation(project_id, 3, QuotationStatus::kDraft);
  assert(repo.InsertQuotation(*tx, v1));
  assert(repo.InsertQuotation(*tx, v2));
  assert(repo.InsertQuotation(*tx, v3));

  auto latest = repo.FindLatestApprovedForProject(*tx, project_id);
  assert(latest.has_value());
  assert(latest->id == v2.id);
  assert(repo.GetLatestQuotationVersion(*tx, project_id) == 3u);

  assert(!repo.FindLatestApprovedForProject(*tx, NextProjectId()).has_value());
  tx->Commit();
}

void VerifyDeliveryReadWrite(Repository& repo) {
  const auto project_id = NextProjectId();

  auto tx = repo.Begin();
  auto q1 = MakeQuotation(project_id, 1, QuotationStatus::kApproved);
  auto q2 = MakeQuotation(project_id, 2, QuotationStatus::kApproved);
  assert(repo.InsertQuotation(*tx, q1));
  assert(repo.InsertQuotation(*tx, q2));

  DeliveryRecord d;
  d.project_id    = project_id;
  d.quotation_id  = q1.id;
  d.delivery_date = ParseDate("2025-03-31");
  d.notes         = "dock 4";
  d.lines         = {MovementLineRecord{"P1", Decimal::Parse("70")}, MovementLineRecord{"P2", Decimal::Parse("0.01")}};
  d.created_at_ms = NowMs();
  assert(repo.InsertDelivery(*tx, d));
  assert(d.id != 0);

  DeliveryRecord unlinked;
  unlinked.project_id    = project_id;
  unlinked.delivery_date = ParseDate("2025-04-01");
  unlinked.lines         = {MovementLineRecord{"P1", Decimal::Parse("1")}};
  unlinked.created_at_ms = NowMs();
  assert(repo.InsertDelivery(*tx, unlinked));

  auto read = repo.GetDelivery(*tx, d.id);
  assert(read.has_value());
  assert(read->quotation_id == q1.id);
  assert(docflow::util::FormatDate(read->delivery_date) == "2025-03-31");
  assert(read->status == MovementStatus::kRecorded);
  assert(read->notes == "dock 4");
  assert(read->lines.size() == 2);
  assert(read->lines[0].quantity == Decimal::Parse("70"));

  auto unlinked_read = repo.GetDelivery(*tx, unlinked.id);
  assert(!unlinked_read->quotation_id.has_value());

  assert(repo.ListDeliveriesByQuotation(*tx, q1.id).size() == 1);

  read->status       = MovementStatus::kDelivered;
  read->quotation_id = q2.id;
  assert(repo.UpdateDelivery(*tx, *read));

  assert(repo.ListDeliveriesByQuotation(*tx, q1.id).empty());
  const auto moved = repo.ListDeliveriesByQuotation(*tx, q2.id);
  assert(moved.size() == 1);
  assert(moved[0].status == MovementStatus::kDelivered);
  assert(moved[0].lines.size() == 2);
  tx->Commit();
}

void VerifyInvoiceAndPaymentReadWrite(Repository& repo) {
  const auto project_id = NextProjectId();

  auto tx = repo.Begin();
  auto q  = MakeQuotation(project_id, 1, QuotationStatus::kApproved);
  assert(repo.InsertQuotation(*tx, q));

  InvoiceRecord inv;
  inv.project_id    = project_id;
  inv.quotation_id  = q.id;
  inv.issue_date    = ParseDate("2025-01-15");
  inv.due_date      = ParseDate("2025-02-15");
  inv.lines         = {InvoiceLineRecord{"P1", Decimal::Parse("40"), Decimal::Parse("12.50"), Decimal::Parse("500")}};
  inv.tax_rate      = Decimal::Parse("10");
  inv.subtotal      = Decimal::Parse("500");
  inv.tax_amount    = Decimal::Parse("50");
  inv.total_amount  = Decimal::Parse("550");
  inv.created_at_ms = NowMs();
  assert(repo.InsertInvoice(*tx, inv));
  assert(inv.id != 0);

  inv.invoice_number = "INV-2025-" + std::to_string(inv.id);
  assert(repo.UpdateInvoice(*tx, inv));

  auto read = repo.GetInvoice(*tx, inv.id);
  assert(read.has_value());
  assert(read->invoice_number == inv.invoice_number);
  assert(!read->delivery_id.has_value());
  assert(docflow::util::FormatDate(read->due_date) == "2025-02-15");
  assert(read->lines.size() == 1);
  assert(read->lines[0].amount == Decimal::Parse("500"));
  assert(read->total_amount == Decimal::Parse("550"));
  assert(read->tax_rate == Decimal::Parse("10"));

  assert(repo.ListInvoicesByQuotation(*tx, q.id).size() == 1);

  PaymentRecord first{0, inv.id, ParseDate("2025-01-20"), Decimal::Parse("100.25"), "bank", "ref-1", NowMs()};
  PaymentRecord second{0, inv.id, ParseDate("2025-01-21"), Decimal::Parse("0.01"), "cash", "", NowMs()};
  assert(repo.InsertPayment(*tx, first));
  assert(repo.InsertPayment(*tx, second));
  assert(first.id != 0 && second.id != first.id);

  const auto payments = repo.ListPaymentsByInvoice(*tx, inv.id);
  assert(payments.size() == 2);
  assert(payments[0].amount == Decimal::Parse("100.25"));
  assert(payments[1].method == "cash");

  read->status = MovementStatus::kReturned;
  assert(repo.UpdateInvoice(*tx, *read));
  assert(repo.GetInvoice(*tx, inv.id)->status == MovementStatus::kReturned);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  const auto project_id = NextProjectId();

  std::uint64_t id = 0;
  {
    auto tx = repo.Begin();
    auto q  = MakeQuotation(project_id, 1, QuotationStatus::kDraft);
    assert(repo.InsertQuotation(*tx, q));
    id = q.id;
    tx->Rollback();
  }

  {
    // dropped without Commit()
    auto tx = repo.Begin();
    auto q  = MakeQuotation(project_id, 1, QuotationStatus::kDraft);
    assert(repo.InsertQuotation(*tx, q));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetQuotation(*check_tx, id).has_value());
  assert(!repo.GetLatestQuotationVersion(*check_tx, project_id).has_value());
  check_tx->Commit();
}

void VerifyMissingRows(Repository& repo) {
  auto tx = repo.Begin();
  assert(!repo.GetQuotation(*tx, 987654321).has_value());
  assert(!repo.GetDelivery(*tx, 987654321).has_value());
  assert(!repo.GetInvoice(*tx, 987654321).has_value());
  assert(repo.ListPaymentsByInvoice(*tx, 987654321).empty());

  DeliveryRecord ghost;
  ghost.id = 987654321;
  assert(!repo.UpdateDelivery(*tx, ghost));
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  const auto project_id = NextProjectId();

  auto          repo = backend.make_repository();
  std::uint64_t quotation_id = 0;
  std::uint64_t delivery_id  = 0;
  {
    auto tx = repo->Begin();
    auto q  = MakeQuotation(project_id, 4, QuotationStatus::kAccepted);
    assert(repo->InsertQuotation(*tx, q));
    quotation_id = q.id;

    DeliveryRecord d;
    d.project_id    = project_id;
    d.quotation_id  = q.id;
    d.delivery_date = ParseDate("2024-12-31");
    d.lines         = {MovementLineRecord{"P1", Decimal::Parse("30")}};
    d.created_at_ms = NowMs();
    assert(repo->InsertDelivery(*tx, d));
    delivery_id = d.id;

    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto q  = repo->GetQuotation(*tx, quotation_id);
  assert(q.has_value());
  assert(q->version == 4);
  assert(q->status == QuotationStatus::kAccepted);

  auto d = repo->GetDelivery(*tx, delivery_id);
  assert(d.has_value());
  assert(d->lines[0].quantity == Decimal::Parse("30"));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if DOCFLOW_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("docflow_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<docflow::db::sqlite::SqliteDB>(db_path);
    db->ApplySchema(docflow::db::sql::SqliteSchema());
    return std::make_shared<docflow::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if DOCFLOW_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("DOCFLOW_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("DOCFLOW_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<docflow::db::postgres::PgPool>(conninfo);
    pool->ApplySchema(docflow::db::sql::PostgresSchema());
    return std::make_shared<docflow::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyQuotationReadWrite(*repo);
    VerifyLatestApprovedSelection(*repo);
    VerifyDeliveryReadWrite(*repo);
    VerifyInvoiceAndPaymentReadWrite(*repo);
    VerifyRollbackBehavior(*repo);
    VerifyMissingRows(*repo);
  }

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if DOCFLOW_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if DOCFLOW_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "docflow_integration_repository_parity: pass\n";
  return 0;
}
