#include "workflow_orchestrator.hpp"

#include <cstdio>
#include <map>
#include <utility>

#include "internal/guard/allowance.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace docflow::core {

using docflow::observability::IntField;
using docflow::observability::StringField;
using namespace docflow::db::model;

namespace {

// How often a status change follows a row whose quotation reference moved
// while it waited for the lock.
constexpr int kReferenceAttempts = 3;

std::int64_t AsField(std::uint64_t id) {
  return static_cast<std::int64_t>(id);
}

std::string DeliveryNotFound(std::uint64_t id) {
  return "delivery " + std::to_string(id) + " not found";
}

std::string InvoiceNotFound(std::uint64_t id) {
  return "invoice " + std::to_string(id) + " not found";
}

util::Decimal SumPayments(const std::vector<PaymentRecord>& payments) {
  util::Decimal paid;
  for (const auto& payment : payments) {
    paid += payment.amount;
  }
  return paid;
}

} // namespace

std::string_view ToString(PaymentStatus status) {
  switch (status) {
    case PaymentStatus::kUnpaid:
      return "UNPAID";
    case PaymentStatus::kPartiallyPaid:
      return "PARTIALLY_PAID";
    case PaymentStatus::kPaid:
      return "PAID";
  }
  return "UNKNOWN";
}

std::string FormatInvoiceNumber(int year, std::uint64_t invoice_id) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "INV-%04d-%06llu", year, static_cast<unsigned long long>(invoice_id));
  return buf;
}

PaymentStatus DerivePaymentStatus(util::Decimal total, util::Decimal paid) {
  if (paid >= total) return PaymentStatus::kPaid;
  if (paid.IsZero()) return PaymentStatus::kUnpaid;
  return PaymentStatus::kPartiallyPaid;
}

WorkflowOrchestrator::WorkflowOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockService> locks,
                                           WorkflowOptions options)
    : repository_(std::move(repository)), locks_(std::move(locks)), options_(std::move(options)) {
}

QuotationRecord WorkflowOrchestrator::LoadGatedQuotation(db::Transaction& tx, std::uint64_t quotation_id, std::string_view attempted) const {
  auto quotation = repository_->GetQuotation(tx, quotation_id);
  if (!quotation) {
    throw util::NotFound("quotation " + std::to_string(quotation_id) + " not found");
  }
  if (!model::PassesGate(options_.movement_gate, quotation->status)) {
    throw util::InvalidTransition(std::string(model::ToString(quotation->status)), std::string(attempted),
                                  options_.movement_gate == model::MovementGate::kAcceptedOnly
                                      ? "quotation must be ACCEPTED"
                                      : "quotation must be APPROVED, SENT or ACCEPTED");
  }
  return *std::move(quotation);
}

template <typename LoadRef, typename Fn>
auto WorkflowOrchestrator::UnderReferencedQuotation(LoadRef&& load_ref, Fn&& fn) {
  for (int attempt = 0; attempt < kReferenceAttempts; ++attempt) {
    const std::optional<std::uint64_t> reference = load_ref();

    auto result = reference ? locks_->WithQuotationLock(*reference, [&] { return fn(reference); }) : fn(reference);
    if (result) {
      return *std::move(result);
    }
  }
  throw util::StorageError("quotation reference changed concurrently; please try again", true);
}

// ---------------------------------------------------------------------
// Creation
// ---------------------------------------------------------------------

DeliveryRecord WorkflowOrchestrator::CreateDelivery(std::uint64_t quotation_id, const CreateDeliveryRequest& request) {
  guard::QuantityGuard::ValidateProposal(request.lines);

  return locks_->WithQuotationLock(quotation_id, [&] {
    auto tx = repository_->Begin();

    const auto quotation  = LoadGatedQuotation(*tx, quotation_id, "create delivery");
    const auto deliveries = repository_->ListDeliveriesByQuotation(*tx, quotation_id);
    guard::QuantityGuard::Check(guard::DeliveryAllowance(quotation, deliveries), request.lines);

    DeliveryRecord delivery;
    delivery.project_id    = quotation.project_id;
    delivery.quotation_id  = quotation_id;
    delivery.delivery_date = request.delivery_date;
    delivery.status        = model::MovementStatus::kRecorded;
    delivery.notes         = request.notes;
    delivery.created_at_ms = util::ToUnixMillis(util::Now());
    for (const auto& line : request.lines) {
      delivery.lines.push_back(MovementLineRecord{line.product_id, line.quantity});
    }

    db::ThrowIfFailed(repository_->InsertDelivery(*tx, delivery), "create delivery");
    tx->Commit();

    DOCFLOW_LOG_DEBUG("delivery recorded", {IntField("delivery_id", AsField(delivery.id)), IntField("quotation_id", AsField(quotation_id)),
                                            IntField("lines", static_cast<std::int64_t>(delivery.lines.size()))});
    return delivery;
  });
}

InvoiceRecord WorkflowOrchestrator::CreateInvoice(std::uint64_t quotation_id, const CreateInvoiceRequest& request) {
  guard::QuantityGuard::ValidateProposal(request.lines);
  if (request.due_date < request.issue_date) {
    throw util::InvalidArgument("due date " + util::FormatDate(request.due_date) + " is earlier than issue date " +
                                util::FormatDate(request.issue_date));
  }
  const auto tax_rate = request.tax_rate.value_or(options_.default_tax_rate);
  if (tax_rate.IsNegative()) {
    throw util::InvalidArgument("tax rate must not be negative, got " + tax_rate.ToString());
  }

  return locks_->WithQuotationLock(quotation_id, [&] {
    auto tx = repository_->Begin();

    const auto quotation = LoadGatedQuotation(*tx, quotation_id, "create invoice");

    if (request.delivery_id) {
      const auto source = repository_->GetDelivery(*tx, *request.delivery_id);
      if (!source) {
        throw util::NotFound(DeliveryNotFound(*request.delivery_id));
      }
      if (source->quotation_id != quotation_id) {
        throw util::InvalidArgument("delivery " + std::to_string(*request.delivery_id) + " does not belong to quotation " +
                                    std::to_string(quotation_id));
      }
    }

    const auto deliveries = repository_->ListDeliveriesByQuotation(*tx, quotation_id);
    const auto invoices   = repository_->ListInvoicesByQuotation(*tx, quotation_id);
    guard::QuantityGuard::Check(guard::InvoiceAllowance(quotation, deliveries, invoices, options_.invoice_authorization), request.lines);

    // first quoted price wins when a product is quoted on several lines
    std::map<std::string, util::Decimal> prices;
    for (const auto& line : quotation.lines) {
      prices.emplace(line.product_id, line.unit_price);
    }

    InvoiceRecord invoice;
    invoice.project_id    = quotation.project_id;
    invoice.quotation_id  = quotation_id;
    invoice.delivery_id   = request.delivery_id;
    invoice.issue_date    = request.issue_date;
    invoice.due_date      = request.due_date;
    invoice.status        = model::MovementStatus::kRecorded;
    invoice.tax_rate      = tax_rate;
    invoice.created_at_ms = util::ToUnixMillis(util::Now());
    for (const auto& line : request.lines) {
      const auto price  = prices.at(line.product_id);
      const auto amount = line.quantity.Multiply(price);
      invoice.lines.push_back(InvoiceLineRecord{line.product_id, line.quantity, price, amount});
      invoice.subtotal += amount;
    }
    invoice.tax_amount   = invoice.subtotal.Percent(tax_rate);
    invoice.total_amount = invoice.subtotal + invoice.tax_amount;

    db::ThrowIfFailed(repository_->InsertInvoice(*tx, invoice), "create invoice");
    invoice.invoice_number = FormatInvoiceNumber(util::YearOf(invoice.issue_date), invoice.id);
    db::ThrowIfFailed(repository_->UpdateInvoice(*tx, invoice), "number invoice");
    tx->Commit();

    DOCFLOW_LOG_DEBUG("invoice recorded", {IntField("invoice_id", AsField(invoice.id)), StringField("number", invoice.invoice_number),
                                           IntField("quotation_id", AsField(quotation_id)), StringField("total", invoice.total_amount.ToString())});
    return invoice;
  });
}

// ---------------------------------------------------------------------
// Reassignment
// ---------------------------------------------------------------------

DeliveryRecord WorkflowOrchestrator::ReassignDelivery(std::uint64_t delivery_id, std::uint64_t target_quotation_id) {
  return locks_->WithQuotationLock(target_quotation_id, [&] {
    auto tx = repository_->Begin();

    auto delivery = repository_->GetDelivery(*tx, delivery_id);
    if (!delivery) {
      throw util::NotFound(DeliveryNotFound(delivery_id));
    }
    const auto target = repository_->GetQuotation(*tx, target_quotation_id);
    if (!target) {
      throw util::NotFound("quotation " + std::to_string(target_quotation_id) + " not found");
    }
    if (!model::IsApproved(target->status)) {
      throw util::ReassignmentPolicy("quotation " + std::to_string(target_quotation_id) + " is " + std::string(model::ToString(target->status)) +
                                     "; deliveries can only move to an APPROVED, SENT or ACCEPTED quotation");
    }
    if (target->project_id != delivery->project_id) {
      throw util::ReassignmentPolicy("quotation " + std::to_string(target_quotation_id) + " belongs to project " +
                                     std::to_string(target->project_id) + ", delivery " + std::to_string(delivery_id) + " to project " +
                                     std::to_string(delivery->project_id));
    }

    const auto previous = delivery->quotation_id;
    if (previous == target_quotation_id) {
      tx->Commit();
      return *std::move(delivery);
    }

    delivery->quotation_id = target_quotation_id;
    db::ThrowIfFailed(repository_->UpdateDelivery(*tx, *delivery), "reassign delivery");
    tx->Commit();

    DOCFLOW_LOG_INFO("delivery reassigned", {IntField("delivery_id", AsField(delivery_id)), IntField("project_id", AsField(delivery->project_id)),
                                             StringField("from_quotation", previous ? std::to_string(*previous) : "none"),
                                             IntField("to_quotation", AsField(target_quotation_id)),
                                             IntField("target_version", static_cast<std::int64_t>(target->version))});
    return *std::move(delivery);
  });
}

// ---------------------------------------------------------------------
// Status changes
// ---------------------------------------------------------------------

DeliveryRecord WorkflowOrchestrator::TransitionDelivery(std::uint64_t delivery_id, model::MovementAction action) {
  return UnderReferencedQuotation([&] { return GetDelivery(delivery_id).quotation_id; },
                                  [&](std::optional<std::uint64_t> locked) -> std::optional<DeliveryRecord> {
                                    auto tx       = repository_->Begin();
                                    auto delivery = repository_->GetDelivery(*tx, delivery_id);
                                    if (!delivery) {
                                      throw util::NotFound(DeliveryNotFound(delivery_id));
                                    }
                                    if (delivery->quotation_id != locked) {
                                      return std::nullopt;
                                    }

                                    delivery->status = model::ApplyTransition(delivery->status, action);
                                    db::ThrowIfFailed(repository_->UpdateDelivery(*tx, *delivery), "update delivery status");
                                    tx->Commit();

                                    DOCFLOW_LOG_DEBUG("delivery status changed", {IntField("delivery_id", AsField(delivery_id)),
                                                                                  StringField("status", model::ToString(delivery->status))});
                                    return delivery;
                                  });
}

InvoiceRecord WorkflowOrchestrator::TransitionInvoice(std::uint64_t invoice_id, model::MovementAction action) {
  auto load_ref = [&]() -> std::optional<std::uint64_t> {
    auto tx      = repository_->Begin();
    auto invoice = repository_->GetInvoice(*tx, invoice_id);
    if (!invoice) {
      throw util::NotFound(InvoiceNotFound(invoice_id));
    }
    tx->Commit();
    return invoice->quotation_id;
  };

  // The invoice lock nests inside the quotation lock so that a payment
  // cannot land while the invoice is being returned.
  return UnderReferencedQuotation(load_ref, [&](std::optional<std::uint64_t> locked) {
    return locks_->WithInvoiceLock(invoice_id, [&]() -> std::optional<InvoiceRecord> {
      auto tx      = repository_->Begin();
      auto invoice = repository_->GetInvoice(*tx, invoice_id);
      if (!invoice) {
        throw util::NotFound(InvoiceNotFound(invoice_id));
      }
      if (invoice->quotation_id != locked) {
        return std::nullopt;
      }

      invoice->status = model::ApplyTransition(invoice->status, action);
      db::ThrowIfFailed(repository_->UpdateInvoice(*tx, *invoice), "update invoice status");
      tx->Commit();

      DOCFLOW_LOG_DEBUG("invoice status changed",
                        {IntField("invoice_id", AsField(invoice_id)), StringField("status", model::ToString(invoice->status))});
      return invoice;
    });
  });
}

DeliveryRecord WorkflowOrchestrator::MarkDeliveryDelivered(std::uint64_t delivery_id) {
  return TransitionDelivery(delivery_id, model::MovementAction::kMarkDelivered);
}

DeliveryRecord WorkflowOrchestrator::MarkDeliveryReturned(std::uint64_t delivery_id) {
  return TransitionDelivery(delivery_id, model::MovementAction::kMarkReturned);
}

InvoiceRecord WorkflowOrchestrator::MarkInvoiceReturned(std::uint64_t invoice_id) {
  return TransitionInvoice(invoice_id, model::MovementAction::kMarkReturned);
}

// ---------------------------------------------------------------------
// Payments
// ---------------------------------------------------------------------

PaymentRecord WorkflowOrchestrator::RecordPayment(std::uint64_t invoice_id, const PaymentRequest& request) {
  if (!request.amount.IsPositive()) {
    throw util::InvalidArgument("payment amount must be greater than zero, got " + request.amount.ToString());
  }

  return locks_->WithInvoiceLock(invoice_id, [&] {
    auto tx = repository_->Begin();

    const auto invoice = repository_->GetInvoice(*tx, invoice_id);
    if (!invoice) {
      throw util::NotFound(InvoiceNotFound(invoice_id));
    }
    if (invoice->status == model::MovementStatus::kReturned) {
      throw util::InvalidTransition(std::string(model::ToString(invoice->status)), "record payment", "returned invoices do not accept payments");
    }

    const auto balance = invoice->total_amount - SumPayments(repository_->ListPaymentsByInvoice(*tx, invoice_id));
    if (request.amount > balance) {
      throw util::InvalidArgument("payment amount " + request.amount.ToString() + " exceeds remaining balance " + balance.ToString() +
                                  " of invoice " + invoice->invoice_number);
    }

    PaymentRecord payment;
    payment.invoice_id    = invoice_id;
    payment.payment_date  = request.payment_date;
    payment.amount        = request.amount;
    payment.method        = request.method;
    payment.reference     = request.reference;
    payment.created_at_ms = util::ToUnixMillis(util::Now());

    db::ThrowIfFailed(repository_->InsertPayment(*tx, payment), "record payment");
    tx->Commit();

    DOCFLOW_LOG_DEBUG("payment recorded", {IntField("invoice_id", AsField(invoice_id)), StringField("amount", payment.amount.ToString()),
                                           StringField("balance", (balance - payment.amount).ToString())});
    return payment;
  });
}

// ---------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------

DeliveryRecord WorkflowOrchestrator::GetDelivery(std::uint64_t delivery_id) {
  auto tx       = repository_->Begin();
  auto delivery = repository_->GetDelivery(*tx, delivery_id);
  if (!delivery) {
    throw util::NotFound(DeliveryNotFound(delivery_id));
  }
  tx->Commit();
  return *std::move(delivery);
}

InvoiceSummary WorkflowOrchestrator::GetInvoice(std::uint64_t invoice_id) {
  auto tx      = repository_->Begin();
  auto invoice = repository_->GetInvoice(*tx, invoice_id);
  if (!invoice) {
    throw util::NotFound(InvoiceNotFound(invoice_id));
  }

  InvoiceSummary summary;
  summary.payments = repository_->ListPaymentsByInvoice(*tx, invoice_id);
  tx->Commit();

  summary.invoice           = *std::move(invoice);
  summary.paid_amount       = SumPayments(summary.payments);
  summary.remaining_balance = summary.invoice.total_amount - summary.paid_amount;
  summary.payment_status    = DerivePaymentStatus(summary.invoice.total_amount, summary.paid_amount);
  return summary;
}

guard::QuantityMap WorkflowOrchestrator::RemainingDeliverable(std::uint64_t quotation_id) {
  auto tx        = repository_->Begin();
  auto quotation = repository_->GetQuotation(*tx, quotation_id);
  if (!quotation) {
    throw util::NotFound("quotation " + std::to_string(quotation_id) + " not found");
  }
  const auto deliveries = repository_->ListDeliveriesByQuotation(*tx, quotation_id);
  tx->Commit();

  return guard::QuantityGuard::Remaining(guard::DeliveryAllowance(*quotation, deliveries));
}

guard::QuantityMap WorkflowOrchestrator::RemainingInvoiceable(std::uint64_t quotation_id) {
  auto tx        = repository_->Begin();
  auto quotation = repository_->GetQuotation(*tx, quotation_id);
  if (!quotation) {
    throw util::NotFound("quotation " + std::to_string(quotation_id) + " not found");
  }
  const auto deliveries = repository_->ListDeliveriesByQuotation(*tx, quotation_id);
  const auto invoices   = repository_->ListInvoicesByQuotation(*tx, quotation_id);
  tx->Commit();

  return guard::QuantityGuard::Remaining(guard::InvoiceAllowance(*quotation, deliveries, invoices, options_.invoice_authorization));
}

} // namespace docflow::core
