#include "internal/guard/allowance.hpp"

namespace docflow::guard {

using docflow::model::CountsTowardConsumption;

namespace {

template <typename Lines>
QuantityMap Sum(const Lines& lines) {
  QuantityMap out;
  for (const auto& line : lines) {
    out[line.product_id] += line.quantity;
  }
  return out;
}

} // namespace

QuantityMap AuthorizedFromQuotation(const db::model::QuotationRecord& quotation) {
  return Sum(quotation.lines);
}

Allowance DeliveryAllowance(const db::model::QuotationRecord& quotation, const std::vector<db::model::DeliveryRecord>& deliveries) {
  Allowance allowance;
  allowance.authorized = AuthorizedFromQuotation(quotation);
  allowance.recorded.reserve(deliveries.size());
  for (const auto& delivery : deliveries) {
    allowance.recorded.push_back(RecordedMovement{Sum(delivery.lines), CountsTowardConsumption(delivery.status)});
  }
  return allowance;
}

Allowance InvoiceAllowance(const db::model::QuotationRecord&            quotation,
                           const std::vector<db::model::DeliveryRecord>& deliveries,
                           const std::vector<db::model::InvoiceRecord>&  invoices,
                           InvoiceAuthorization                          policy) {
  Allowance allowance;
  allowance.authorized = AuthorizedFromQuotation(quotation);

  if (policy == InvoiceAuthorization::kDelivered) {
    for (auto& [product, quantity] : allowance.authorized) {
      quantity = util::Decimal{};
    }
    for (const auto& delivery : deliveries) {
      if (!CountsTowardConsumption(delivery.status)) continue;
      for (const auto& line : delivery.lines) {
        auto it = allowance.authorized.find(line.product_id);
        if (it != allowance.authorized.end()) {
          it->second += line.quantity;
        }
      }
    }
  }

  allowance.recorded.reserve(invoices.size());
  for (const auto& invoice : invoices) {
    allowance.recorded.push_back(RecordedMovement{Sum(invoice.lines), CountsTowardConsumption(invoice.status)});
  }
  return allowance;
}

} // namespace docflow::guard
