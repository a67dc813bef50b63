#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace docflow::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertQuotation(Transaction&, model::QuotationRecord&) override;
  Result UpdateQuotation(Transaction&, const model::QuotationRecord&) override;
  std::optional<model::QuotationRecord> GetQuotation(Transaction&, std::uint64_t id) override;
  std::optional<std::uint32_t> GetLatestQuotationVersion(Transaction&, std::uint64_t project_id) override;
  std::optional<model::QuotationRecord> FindLatestApprovedForProject(Transaction&, std::uint64_t project_id) override;

  Result InsertDelivery(Transaction&, model::DeliveryRecord&) override;
  Result UpdateDelivery(Transaction&, const model::DeliveryRecord&) override;
  std::optional<model::DeliveryRecord> GetDelivery(Transaction&, std::uint64_t id) override;
  std::vector<model::DeliveryRecord> ListDeliveriesByQuotation(Transaction&, std::uint64_t quotation_id) override;

  Result InsertInvoice(Transaction&, model::InvoiceRecord&) override;
  Result UpdateInvoice(Transaction&, const model::InvoiceRecord&) override;
  std::optional<model::InvoiceRecord> GetInvoice(Transaction&, std::uint64_t id) override;
  std::vector<model::InvoiceRecord> ListInvoicesByQuotation(Transaction&, std::uint64_t quotation_id) override;

  Result InsertPayment(Transaction&, model::PaymentRecord&) override;
  std::vector<model::PaymentRecord> ListPaymentsByInvoice(Transaction&, std::uint64_t invoice_id) override;

  // Shared with SqliteLockStore.
  static Result Translate(sqlite3* db, int rc);

private:
  static SqliteTransaction& TX(Transaction&);

  std::shared_ptr<SqliteDB> db_;
};

}
