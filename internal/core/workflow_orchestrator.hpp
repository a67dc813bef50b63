#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/core/workflow_types.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/delivery_record.hpp"
#include "internal/db/model/invoice_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/guard/quantity_guard.hpp"
#include "internal/lock/lock_service.hpp"

namespace docflow::core {

/*
  Delivery / invoice use cases.

  Every write that can change a quotation's consumption runs inside
  WithQuotationLock for that quotation and opens its storage transaction
  only once the lock is held, so the guard always sees every movement
  committed before it. Work on different quotations proceeds in parallel.

  Payments are not quantity-guarded; they serialize on the invoice lock.
*/
class WorkflowOrchestrator {
 public:
  WorkflowOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockService> locks, WorkflowOptions options = {});

  db::model::DeliveryRecord CreateDelivery(std::uint64_t quotation_id, const CreateDeliveryRequest& request);
  db::model::InvoiceRecord  CreateInvoice(std::uint64_t quotation_id, const CreateInvoiceRequest& request);

  // Moves a delivery to another quotation of the same project. The target
  // must be approved-equivalent; no quantity check is made.
  db::model::DeliveryRecord ReassignDelivery(std::uint64_t delivery_id, std::uint64_t target_quotation_id);

  db::model::DeliveryRecord MarkDeliveryDelivered(std::uint64_t delivery_id);
  db::model::DeliveryRecord MarkDeliveryReturned(std::uint64_t delivery_id);
  db::model::InvoiceRecord  MarkInvoiceReturned(std::uint64_t invoice_id);

  db::model::PaymentRecord RecordPayment(std::uint64_t invoice_id, const PaymentRequest& request);

  db::model::DeliveryRecord GetDelivery(std::uint64_t delivery_id);
  InvoiceSummary            GetInvoice(std::uint64_t invoice_id);

  guard::QuantityMap RemainingDeliverable(std::uint64_t quotation_id);
  guard::QuantityMap RemainingInvoiceable(std::uint64_t quotation_id);

  const WorkflowOptions& Options() const {
    return options_;
  }

 private:
  db::model::DeliveryRecord TransitionDelivery(std::uint64_t delivery_id, model::MovementAction action);
  db::model::InvoiceRecord  TransitionInvoice(std::uint64_t invoice_id, model::MovementAction action);

  // Runs fn under the lock of whatever quotation the row references when
  // the lock is taken. A row without a quotation runs unlocked.
  template <typename LoadRef, typename Fn>
  auto UnderReferencedQuotation(LoadRef&& load_ref, Fn&& fn);

  db::model::QuotationRecord LoadGatedQuotation(db::Transaction& tx, std::uint64_t quotation_id, std::string_view attempted) const;

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<lock::LockService> locks_;
  WorkflowOptions                    options_;
};

// "INV-2025-000042"
std::string FormatInvoiceNumber(int year, std::uint64_t invoice_id);

// paid vs total -> UNPAID / PARTIALLY_PAID / PAID
PaymentStatus DerivePaymentStatus(util::Decimal total, util::Decimal paid);

} // namespace docflow::core
