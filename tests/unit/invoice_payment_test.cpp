#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/quotation_service.hpp"
#include "internal/core/workflow_orchestrator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/lock_service.hpp"
#include "internal/lock/memory_lock_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using docflow::core::CreateDeliveryRequest;
using docflow::core::CreateInvoiceRequest;
using docflow::core::PaymentRequest;
using docflow::core::PaymentStatus;
using docflow::core::QuotationLineInput;
using docflow::core::QuotationService;
using docflow::core::WorkflowOptions;
using docflow::core::WorkflowOrchestrator;
using docflow::guard::ProposedLine;
using docflow::model::MovementStatus;
using docflow::util::Decimal;
using docflow::util::ParseDate;

Decimal D(const char* text) {
  return Decimal::Parse(text);
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

struct Fixture {
  explicit Fixture(WorkflowOptions options = {}) {
    auto repository = std::make_shared<docflow::db::memory::MemoryRepository>();
    auto locks      = std::make_shared<docflow::lock::LockService>(std::make_shared<docflow::lock::MemoryLockStore>());
    quotations      = std::make_shared<QuotationService>(repository, locks);
    orchestrator    = std::make_shared<WorkflowOrchestrator>(repository, locks, options);
  }

  std::uint64_t ApprovedQuotation(std::vector<QuotationLineInput> lines) {
    const auto id = quotations->CreateQuotation(1, lines).id;
    quotations->Submit(id);
    quotations->ApplyApprovalDecision(id, true);
    return id;
  }

  std::uint64_t Deliver(std::uint64_t quotation_id, const char* product, const char* qty) {
    CreateDeliveryRequest request;
    request.delivery_date = ParseDate("2025-03-01");
    request.lines         = {ProposedLine{product, D(qty)}};
    return orchestrator->CreateDelivery(quotation_id, request).id;
  }

  std::shared_ptr<QuotationService>     quotations;
  std::shared_ptr<WorkflowOrchestrator> orchestrator;
};

CreateInvoiceRequest Invoice(const char* product, const char* qty) {
  CreateInvoiceRequest request;
  request.issue_date = ParseDate("2025-03-15");
  request.due_date   = ParseDate("2025-04-14");
  request.lines      = {ProposedLine{product, D(qty)}};
  return request;
}

PaymentRequest Payment(const char* amount) {
  PaymentRequest request;
  request.payment_date = ParseDate("2025-03-20");
  request.amount       = D(amount);
  request.method       = "bank_transfer";
  request.reference    = "TX-1";
  return request;
}

void TestInvoiceAmountsAndNumber() {
  Fixture    f;
  const auto q = f.ApprovedQuotation({QuotationLineInput{"P1", D("100"), D("12.50")}});
  f.Deliver(q, "P1", "70");

  const auto invoice = f.orchestrator->CreateInvoice(q, Invoice("P1", "40"));
  assert(invoice.lines.size() == 1);
  assert(invoice.lines[0].unit_price == D("12.50"));
  assert(invoice.lines[0].amount == D("500"));
  assert(invoice.subtotal == D("500"));
  assert(invoice.tax_rate == D("10"));
  assert(invoice.tax_amount == D("50"));
  assert(invoice.total_amount == D("550"));
  assert(invoice.status == MovementStatus::kRecorded);
  assert(invoice.invoice_number == docflow::core::FormatInvoiceNumber(2025, invoice.id));
  assert(invoice.invoice_number.rfind("INV-2025-", 0) == 0);
  assert(invoice.invoice_number.size() == std::string("INV-2025-000001").size());

  // only 70 delivered, 40 already invoiced
  try {
    f.orchestrator->CreateInvoice(q, Invoice("P1", "31"));
    assert(false && "31 exceeds the 30 delivered but not invoiced");
  } catch (const docflow::util::QuantityExceeded& e) {
    assert(e.ProductId() == "P1");
    assert(e.Remaining() == D("30"));
  }
  assert(f.orchestrator->RemainingInvoiceable(q).at("P1") == D("30"));
  f.orchestrator->CreateInvoice(q, Invoice("P1", "30"));
}

void TestInvoiceNumberFormat() {
  assert(docflow::core::FormatInvoiceNumber(2025, 42) == "INV-2025-000042");
  assert(docflow::core::FormatInvoiceNumber(2026, 1234567) == "INV-2026-1234567");
}

void TestInvoiceRequestValidation() {
  Fixture    f;
  const auto q = f.ApprovedQuotation({QuotationLineInput{"P1", D("10"), D("3.33")}});
  const auto delivered = f.Deliver(q, "P1", "10");

  auto overridden     = Invoice("P1", "1");
  overridden.tax_rate = D("8.5");
  const auto invoice  = f.orchestrator->CreateInvoice(q, overridden);
  assert(invoice.tax_rate == D("8.5"));
  // 3.33 * 8.5% = 0.28305 -> 0.28
  assert(invoice.tax_amount == D("0.28"));
  assert(invoice.total_amount == D("3.61"));

  auto backwards     = Invoice("P1", "1");
  backwards.due_date = ParseDate("2025-03-14");
  assert(Throws<docflow::util::InvalidArgument>([&] { f.orchestrator->CreateInvoice(q, backwards); }));

  auto negative     = Invoice("P1", "1");
  negative.tax_rate = D("-1");
  assert(Throws<docflow::util::InvalidArgument>([&] { f.orchestrator->CreateInvoice(q, negative); }));

  auto missing        = Invoice("P1", "1");
  missing.delivery_id = 9999;
  assert(Throws<docflow::util::NotFound>([&] { f.orchestrator->CreateInvoice(q, missing); }));

  const auto other = f.ApprovedQuotation({QuotationLineInput{"P1", D("10"), D("1")}});
  auto       foreign = Invoice("P1", "1");
  foreign.delivery_id = f.Deliver(other, "P1", "1");
  assert(Throws<docflow::util::InvalidArgument>([&] { f.orchestrator->CreateInvoice(q, foreign); }));

  auto linked        = Invoice("P1", "1");
  linked.delivery_id = delivered;
  assert(f.orchestrator->CreateInvoice(q, linked).delivery_id == delivered);
}

void TestPayments() {
  Fixture    f;
  const auto q = f.ApprovedQuotation({QuotationLineInput{"P1", D("100"), D("12.50")}});
  f.Deliver(q, "P1", "40");
  const auto invoice = f.orchestrator->CreateInvoice(q, Invoice("P1", "40"));

  auto summary = f.orchestrator->GetInvoice(invoice.id);
  assert(summary.payment_status == PaymentStatus::kUnpaid);
  assert(summary.remaining_balance == D("550"));

  f.orchestrator->RecordPayment(invoice.id, Payment("200"));
  summary = f.orchestrator->GetInvoice(invoice.id);
  assert(summary.payment_status == PaymentStatus::kPartiallyPaid);
  assert(summary.paid_amount == D("200"));
  assert(summary.remaining_balance == D("350"));
  assert(summary.payments.size() == 1);
  assert(summary.payments[0].method == "bank_transfer");

  assert(Throws<docflow::util::InvalidArgument>([&] { f.orchestrator->RecordPayment(invoice.id, Payment("350.01")); }));
  assert(Throws<docflow::util::InvalidArgument>([&] { f.orchestrator->RecordPayment(invoice.id, Payment("0")); }));
  assert(Throws<docflow::util::InvalidArgument>([&] { f.orchestrator->RecordPayment(invoice.id, Payment("-5")); }));
  assert(Throws<docflow::util::NotFound>([&] { f.orchestrator->RecordPayment(4242, Payment("1")); }));

  const auto payment = f.orchestrator->RecordPayment(invoice.id, Payment("350"));
  assert(payment.invoice_id == invoice.id);
  summary = f.orchestrator->GetInvoice(invoice.id);
  assert(summary.payment_status == PaymentStatus::kPaid);
  assert(summary.remaining_balance.IsZero());
  assert(Throws<docflow::util::InvalidArgument>([&] { f.orchestrator->RecordPayment(invoice.id, Payment("0.01")); }));
}

void TestReturnedInvoice() {
  Fixture    f;
  const auto q = f.ApprovedQuotation({QuotationLineInput{"P1", D("10"), D("1")}});
  f.Deliver(q, "P1", "10");
  const auto invoice = f.orchestrator->CreateInvoice(q, Invoice("P1", "10"));
  assert(f.orchestrator->RemainingInvoiceable(q).at("P1").IsZero());

  assert(f.orchestrator->MarkInvoiceReturned(invoice.id).status == MovementStatus::kReturned);
  assert(Throws<docflow::util::InvalidTransition>([&] { f.orchestrator->RecordPayment(invoice.id, Payment("1")); }));
  // returning again is allowed and leaves the invoice RETURNED
  assert(f.orchestrator->MarkInvoiceReturned(invoice.id).status == MovementStatus::kReturned);
  assert(Throws<docflow::util::NotFound>([&] { f.orchestrator->MarkInvoiceReturned(4242); }));

  assert(f.orchestrator->RemainingInvoiceable(q).at("P1") == D("10"));
  f.orchestrator->CreateInvoice(q, Invoice("P1", "10"));
}

void TestReturnedDeliveryShrinksInvoiceable() {
  Fixture    f;
  const auto q = f.ApprovedQuotation({QuotationLineInput{"P1", D("10"), D("1")}});
  const auto d = f.Deliver(q, "P1", "6");
  f.Deliver(q, "P1", "4");
  assert(f.orchestrator->RemainingInvoiceable(q).at("P1") == D("10"));

  f.orchestrator->MarkDeliveryReturned(d);
  assert(f.orchestrator->RemainingInvoiceable(q).at("P1") == D("4"));
  assert(Throws<docflow::util::QuantityExceeded>([&] { f.orchestrator->CreateInvoice(q, Invoice("P1", "5")); }));
}

void TestQuotationAuthorizationPolicy() {
  WorkflowOptions options;
  options.invoice_authorization = docflow::guard::InvoiceAuthorization::kQuotation;
  Fixture    f(options);
  const auto q = f.ApprovedQuotation({QuotationLineInput{"P1", D("100"), D("1")}});

  // nothing delivered yet
  f.orchestrator->CreateInvoice(q, Invoice("P1", "60"));
  assert(f.orchestrator->RemainingInvoiceable(q).at("P1") == D("40"));
  assert(Throws<docflow::util::QuantityExceeded>([&] { f.orchestrator->CreateInvoice(q, Invoice("P1", "40.01")); }));
}

void TestZeroTotalIsPaid() {
  Fixture    f;
  const auto q = f.ApprovedQuotation({QuotationLineInput{"FREE", D("5"), D("0")}});
  f.Deliver(q, "FREE", "5");

  const auto invoice = f.orchestrator->CreateInvoice(q, Invoice("FREE", "5"));
  assert(invoice.total_amount.IsZero());

  const auto summary = f.orchestrator->GetInvoice(invoice.id);
  assert(summary.payment_status == PaymentStatus::kPaid);
  assert(docflow::core::DerivePaymentStatus(D("0"), D("0")) == PaymentStatus::kPaid);
}

} // namespace

int main() {
  TestInvoiceAmountsAndNumber();
  TestInvoiceNumberFormat();
  TestInvoiceRequestValidation();
  TestPayments();
  TestReturnedInvoice();
  TestReturnedDeliveryShrinksInvoiceable();
  TestQuotationAuthorizationPolicy();
  TestZeroTotalIsPaid();

  std::cout << "docflow_unit_invoice_payment: pass\n";
  return 0;
}
