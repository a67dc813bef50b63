#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace docflow::db::memory {

using docflow::model::IsApproved;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Quotations
// ------------------------------------------------------------------

Result MemoryRepository::InsertQuotation(Transaction& t, model::QuotationRecord& r) {
  r.id = next_quotation_id_.fetch_add(1);
  TX(t).Apply([record = r](State& s) { s.quotations[record.id] = record; });
  return Result::Ok();
}

Result MemoryRepository::UpdateQuotation(Transaction& t, const model::QuotationRecord& r) {
  if (!TX(t).View().quotations.contains(r.id)) {
    return Result::Err(ErrorCode::NotFound, "quotation " + std::to_string(r.id));
  }
  TX(t).Apply([record = r](State& s) { s.quotations[record.id] = record; });
  return Result::Ok();
}

std::optional<model::QuotationRecord> MemoryRepository::GetQuotation(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.quotations.find(id);
  if (it == s.quotations.end()) return std::nullopt;
  return it->second;
}

std::optional<std::uint32_t> MemoryRepository::GetLatestQuotationVersion(Transaction& t, std::uint64_t project_id) {
  std::optional<std::uint32_t> latest;
  for (const auto& [_, q] : TX(t).View().quotations) {
    if (q.project_id == project_id && (!latest || q.version > *latest)) {
      latest = q.version;
    }
  }
  return latest;
}

std::optional<model::QuotationRecord> MemoryRepository::FindLatestApprovedForProject(Transaction& t, std::uint64_t project_id) {
  const model::QuotationRecord* best = nullptr;
  for (const auto& [_, q] : TX(t).View().quotations) {
    if (q.project_id != project_id || !IsApproved(q.status)) continue;
    if (!best || q.version > best->version) best = &q;
  }
  if (!best) return std::nullopt;
  return *best;
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

Result MemoryRepository::InsertDelivery(Transaction& t, model::DeliveryRecord& r) {
  r.id = next_delivery_id_.fetch_add(1);
  TX(t).Apply([record = r](State& s) { s.deliveries[record.id] = record; });
  return Result::Ok();
}

Result MemoryRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
  auto it = TX(t).View().deliveries.find(r.id);
  if (it == TX(t).View().deliveries.end()) {
    return Result::Err(ErrorCode::NotFound, "delivery " + std::to_string(r.id));
  }

  // Only replay the columns this transaction changed, so a concurrent
  // reassignment and status change on the same row both survive.
  const bool status_changed    = it->second.status != r.status;
  const bool quotation_changed = it->second.quotation_id != r.quotation_id;
  TX(t).Apply([id = r.id, status = r.status, quotation_id = r.quotation_id, status_changed, quotation_changed](State& s) {
    auto row = s.deliveries.find(id);
    if (row == s.deliveries.end()) return;
    if (status_changed) row->second.status = status;
    if (quotation_changed) row->second.quotation_id = quotation_id;
  });
  return Result::Ok();
}

std::optional<model::DeliveryRecord> MemoryRepository::GetDelivery(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.deliveries.find(id);
  if (it == s.deliveries.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeliveryRecord> MemoryRepository::ListDeliveriesByQuotation(Transaction& t, std::uint64_t quotation_id) {
  std::vector<model::DeliveryRecord> out;
  for (const auto& [_, d] : TX(t).View().deliveries) {
    if (d.quotation_id == quotation_id) out.push_back(d);
  }
  return out;
}

// ------------------------------------------------------------------
// Invoices
// ------------------------------------------------------------------

Result MemoryRepository::InsertInvoice(Transaction& t, model::InvoiceRecord& r) {
  r.id = next_invoice_id_.fetch_add(1);
  TX(t).Apply([record = r](State& s) { s.invoices[record.id] = record; });
  return Result::Ok();
}

Result MemoryRepository::UpdateInvoice(Transaction& t, const model::InvoiceRecord& r) {
  auto it = TX(t).View().invoices.find(r.id);
  if (it == TX(t).View().invoices.end()) {
    return Result::Err(ErrorCode::NotFound, "invoice " + std::to_string(r.id));
  }

  const bool status_changed = it->second.status != r.status;
  const bool number_changed = it->second.invoice_number != r.invoice_number;
  TX(t).Apply([id = r.id, status = r.status, number = r.invoice_number, status_changed, number_changed](State& s) {
    auto row = s.invoices.find(id);
    if (row == s.invoices.end()) return;
    if (status_changed) row->second.status = status;
    if (number_changed) row->second.invoice_number = number;
  });
  return Result::Ok();
}

std::optional<model::InvoiceRecord> MemoryRepository::GetInvoice(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.invoices.find(id);
  if (it == s.invoices.end()) return std::nullopt;
  return it->second;
}

std::vector<model::InvoiceRecord> MemoryRepository::ListInvoicesByQuotation(Transaction& t, std::uint64_t quotation_id) {
  std::vector<model::InvoiceRecord> out;
  for (const auto& [_, inv] : TX(t).View().invoices) {
    if (inv.quotation_id == quotation_id) out.push_back(inv);
  }
  return out;
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

Result MemoryRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  if (!TX(t).View().invoices.contains(r.invoice_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "payment references unknown invoice " + std::to_string(r.invoice_id));
  }
  r.id = next_payment_id_.fetch_add(1);
  TX(t).Apply([record = r](State& s) { s.payments[record.id] = record; });
  return Result::Ok();
}

std::vector<model::PaymentRecord> MemoryRepository::ListPaymentsByInvoice(Transaction& t, std::uint64_t invoice_id) {
  std::vector<model::PaymentRecord> out;
  for (const auto& [_, p] : TX(t).View().payments) {
    if (p.invoice_id == invoice_id) out.push_back(p);
  }
  return out;
}

} // namespace docflow::db::memory
