#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/delivery_record.hpp"
#include "internal/db/model/invoice_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/db/model/quotation_record.hpp"

namespace docflow::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Insert* assigns the row id and writes it back into the record
  - Line items are stored and returned in insertion order

  The DB is the source of truth for:
    quotations (+ line items)
    deliveries (+ line items)
    invoices   (+ line items, payments)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Quotations
  // ---------------------------------------------------------------------

  virtual Result InsertQuotation(Transaction&, model::QuotationRecord&) = 0;

  // Rewrites status, totals and (replacing) line items.
  virtual Result UpdateQuotation(Transaction&, const model::QuotationRecord&) = 0;

  virtual std::optional<model::QuotationRecord> GetQuotation(Transaction&, std::uint64_t id) = 0;

  virtual std::optional<std::uint32_t> GetLatestQuotationVersion(Transaction&, std::uint64_t project_id) = 0;

  // Highest version of the project whose status is APPROVED, SENT or ACCEPTED.
  virtual std::optional<model::QuotationRecord> FindLatestApprovedForProject(Transaction&, std::uint64_t project_id) = 0;

  // ---------------------------------------------------------------------
  // Deliveries
  // ---------------------------------------------------------------------

  virtual Result InsertDelivery(Transaction&, model::DeliveryRecord&) = 0;

  // Rewrites status and quotation reference; line items are immutable.
  virtual Result UpdateDelivery(Transaction&, const model::DeliveryRecord&) = 0;

  virtual std::optional<model::DeliveryRecord> GetDelivery(Transaction&, std::uint64_t id) = 0;

  virtual std::vector<model::DeliveryRecord> ListDeliveriesByQuotation(Transaction&, std::uint64_t quotation_id) = 0;

  // ---------------------------------------------------------------------
  // Invoices
  // ---------------------------------------------------------------------

  virtual Result InsertInvoice(Transaction&, model::InvoiceRecord&) = 0;

  // Rewrites status and invoice number; line items and totals are immutable.
  virtual Result UpdateInvoice(Transaction&, const model::InvoiceRecord&) = 0;

  virtual std::optional<model::InvoiceRecord> GetInvoice(Transaction&, std::uint64_t id) = 0;

  virtual std::vector<model::InvoiceRecord> ListInvoicesByQuotation(Transaction&, std::uint64_t quotation_id) = 0;

  // ---------------------------------------------------------------------
  // Payments
  // ---------------------------------------------------------------------

  virtual Result InsertPayment(Transaction&, model::PaymentRecord&) = 0;

  virtual std::vector<model::PaymentRecord> ListPaymentsByInvoice(Transaction&, std::uint64_t invoice_id) = 0;
};

} // namespace docflow::db
