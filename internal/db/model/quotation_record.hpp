#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/util/decimal.hpp"

namespace docflow::db::model {

struct QuotationLineRecord {
  std::string   product_id;
  util::Decimal quantity;
  util::Decimal unit_price;
};

/*
  Persistent quotation row plus its owned line items.

  Line items are replaced wholesale on update and only while the
  quotation is in DRAFT. A new version is always a new row.
*/
struct QuotationRecord {
  std::uint64_t id         = 0;
  std::uint64_t project_id = 0;
  std::uint32_t version    = 0;

  docflow::model::QuotationStatus status = docflow::model::QuotationStatus::kDraft;

  std::vector<QuotationLineRecord> lines;

  // Σ quantity × unit_price, recomputed whenever lines change
  util::Decimal total_amount;

  std::uint64_t created_at_ms = 0;
  std::uint64_t updated_at_ms = 0;
};

} // namespace docflow::db::model
