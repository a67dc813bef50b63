#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace docflow::db::model {

struct InvoiceLineRecord {
  std::string   product_id;
  util::Decimal quantity;
  util::Decimal unit_price;
  util::Decimal amount;
};

struct InvoiceRecord {
  std::uint64_t id = 0;
  std::string   invoice_number;

  std::uint64_t                project_id = 0;
  std::optional<std::uint64_t> quotation_id;
  std::optional<std::uint64_t> delivery_id;

  util::Date issue_date{};
  util::Date due_date{};

  docflow::model::MovementStatus status = docflow::model::MovementStatus::kRecorded;

  std::vector<InvoiceLineRecord> lines;

  // percent, e.g. 10.00
  util::Decimal tax_rate;
  util::Decimal subtotal;
  util::Decimal tax_amount;
  util::Decimal total_amount;

  std::uint64_t created_at_ms = 0;
};

} // namespace docflow::db::model
