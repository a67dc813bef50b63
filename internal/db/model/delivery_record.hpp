#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace docflow::db::model {

struct MovementLineRecord {
  std::string   product_id;
  util::Decimal quantity;
};

/*
  Persistent delivery row.

  quotation_id references a quotation row (any version); it is empty for
  unlinked deliveries and may be rewritten by reassignment.
*/
struct DeliveryRecord {
  std::uint64_t                id         = 0;
  std::uint64_t                project_id = 0;
  std::optional<std::uint64_t> quotation_id;

  util::Date delivery_date{};

  docflow::model::MovementStatus status = docflow::model::MovementStatus::kRecorded;

  std::string notes;

  std::vector<MovementLineRecord> lines;

  std::uint64_t created_at_ms = 0;
};

} // namespace docflow::db::model
