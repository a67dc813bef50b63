#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/invoice_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/guard/allowance.hpp"
#include "internal/guard/quantity_guard.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace docflow::core {

struct WorkflowOptions {
  model::MovementGate         movement_gate         = model::MovementGate::kApprovedOrSent;
  guard::InvoiceAuthorization invoice_authorization = guard::InvoiceAuthorization::kDelivered;

  // percent
  util::Decimal default_tax_rate = util::Decimal::FromInteger(10);
};

struct CreateDeliveryRequest {
  util::Date                       delivery_date{};
  std::string                      notes;
  std::vector<guard::ProposedLine> lines;
};

struct CreateInvoiceRequest {
  util::Date                   issue_date{};
  util::Date                   due_date{};
  std::optional<std::uint64_t> delivery_id;

  // Falls back to WorkflowOptions::default_tax_rate.
  std::optional<util::Decimal> tax_rate;

  std::vector<guard::ProposedLine> lines;
};

struct PaymentRequest {
  util::Date    payment_date{};
  util::Decimal amount;
  std::string   method;
  std::string   reference;
};

enum class PaymentStatus : std::uint8_t {
  kUnpaid,
  kPartiallyPaid,
  kPaid,
};

std::string_view ToString(PaymentStatus status);

struct InvoiceSummary {
  db::model::InvoiceRecord              invoice;
  std::vector<db::model::PaymentRecord> payments;

  util::Decimal paid_amount;
  util::Decimal remaining_balance;
  PaymentStatus payment_status = PaymentStatus::kUnpaid;
};

struct QuotationLineInput {
  std::string   product_id;
  util::Decimal quantity;
  util::Decimal unit_price;
};

} // namespace docflow::core
