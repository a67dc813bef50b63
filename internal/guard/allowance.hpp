#pragma once

#include <cstdint>
#include <vector>

#include "internal/db/model/delivery_record.hpp"
#include "internal/db/model/invoice_record.hpp"
#include "internal/db/model/quotation_record.hpp"
#include "internal/guard/quantity_guard.hpp"

namespace docflow::guard {

// What an invoice may bill against.
enum class InvoiceAuthorization : std::uint8_t {
  kDelivered,  // quantities on non-RETURNED deliveries of the quotation
  kQuotation,  // the quotation's own quantities
};

// Quotation quantities per product; repeated products are summed.
QuantityMap AuthorizedFromQuotation(const db::model::QuotationRecord& quotation);

// authorized = quotation, consumed = non-RETURNED deliveries.
Allowance DeliveryAllowance(const db::model::QuotationRecord& quotation, const std::vector<db::model::DeliveryRecord>& deliveries);

/*
  Products are always the quotation's; under kDelivered a quoted product
  that was never delivered is authorized at zero (so it fails as
  QuantityExceeded, not UnknownProduct). Consumed = non-RETURNED invoices.
*/
Allowance InvoiceAllowance(const db::model::QuotationRecord&            quotation,
                           const std::vector<db::model::DeliveryRecord>& deliveries,
                           const std::vector<db::model::InvoiceRecord>&  invoices,
                           InvoiceAuthorization                          policy);

} // namespace docflow::guard
