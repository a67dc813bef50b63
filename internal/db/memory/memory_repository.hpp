#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace docflow::db::memory {

class MemoryTransaction;

/*
  In-process repository used by tests and by deployments without a
  configured database.

  Transactions never block each other: each one works on a private
  snapshot and replays its write log onto the committed state at
  Commit(). Ids come from repository-wide counters so concurrent
  transactions never hand out the same id.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::uint64_t, model::QuotationRecord> quotations;
    std::map<std::uint64_t, model::DeliveryRecord>  deliveries;
    std::map<std::uint64_t, model::InvoiceRecord>   invoices;
    std::map<std::uint64_t, model::PaymentRecord>   payments;
  };

  std::mutex mutex_;
  State      committed_;

  std::atomic<std::uint64_t> next_quotation_id_{1};
  std::atomic<std::uint64_t> next_delivery_id_{1};
  std::atomic<std::uint64_t> next_invoice_id_{1};
  std::atomic<std::uint64_t> next_payment_id_{1};
};

}
