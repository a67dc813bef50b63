#pragma once

#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace docflow::db::postgres {

/*
  PostgreSQL repository.

  Money and quantities live in NUMERIC(12,2) columns and travel as text
  ("12.50") in both directions so no value ever passes through floating
  point. Dates travel as ISO text.
*/
class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                                InsertQuotation(Transaction&, model::QuotationRecord&) override;
  Result                                UpdateQuotation(Transaction&, const model::QuotationRecord&) override;
  std::optional<model::QuotationRecord> GetQuotation(Transaction&, std::uint64_t id) override;
  std::optional<std::uint32_t>          GetLatestQuotationVersion(Transaction&, std::uint64_t project_id) override;
  std::optional<model::QuotationRecord> FindLatestApprovedForProject(Transaction&, std::uint64_t project_id) override;

  Result                               InsertDelivery(Transaction&, model::DeliveryRecord&) override;
  Result                               UpdateDelivery(Transaction&, const model::DeliveryRecord&) override;
  std::optional<model::DeliveryRecord> GetDelivery(Transaction&, std::uint64_t id) override;
  std::vector<model::DeliveryRecord>   ListDeliveriesByQuotation(Transaction&, std::uint64_t quotation_id) override;

  Result                              InsertInvoice(Transaction&, model::InvoiceRecord&) override;
  Result                              UpdateInvoice(Transaction&, const model::InvoiceRecord&) override;
  std::optional<model::InvoiceRecord> GetInvoice(Transaction&, std::uint64_t id) override;
  std::vector<model::InvoiceRecord>   ListInvoicesByQuotation(Transaction&, std::uint64_t quotation_id) override;

  Result                            InsertPayment(Transaction&, model::PaymentRecord&) override;
  std::vector<model::PaymentRecord> ListPaymentsByInvoice(Transaction&, std::uint64_t invoice_id) override;

  // Shared with PgLockStore.
  static Result Translate(const std::exception& e);

 private:
  static PgTransaction& TX(Transaction&);

  std::shared_ptr<PgPool> pool_;
};

} // namespace docflow::db::postgres
