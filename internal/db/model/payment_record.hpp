#pragma once

#include <cstdint>
#include <string>

#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace docflow::db::model {

struct PaymentRecord {
  std::uint64_t id         = 0;
  std::uint64_t invoice_id = 0;

  util::Date    payment_date{};
  util::Decimal amount;
  std::string   method;
  std::string   reference;

  std::uint64_t created_at_ms = 0;
};

} // namespace docflow::db::model
