#include "internal/guard/quantity_guard.hpp"

#include <set>

#include "internal/util/errors.hpp"

namespace docflow::guard {

void QuantityGuard::ValidateProposal(const std::vector<ProposedLine>& proposed) {
  if (proposed.empty()) {
    throw util::InvalidArgument("at least one line item is required");
  }

  std::set<std::string> seen;
  for (const auto& line : proposed) {
    if (line.product_id.empty()) {
      throw util::InvalidArgument("line item is missing a product");
    }
    if (!seen.insert(line.product_id).second) {
      throw util::InvalidArgument("duplicate product " + line.product_id + " in line items");
    }
    if (!line.quantity.IsPositive()) {
      throw util::InvalidArgument("quantity for product " + line.product_id + " must be greater than zero, got " + line.quantity.ToString());
    }
  }
}

QuantityMap QuantityGuard::Consumed(const std::vector<RecordedMovement>& recorded) {
  QuantityMap consumed;
  for (const auto& movement : recorded) {
    if (!movement.counted) continue;
    for (const auto& [product, quantity] : movement.quantities) {
      consumed[product] += quantity;
    }
  }
  return consumed;
}

QuantityMap QuantityGuard::Remaining(const Allowance& allowance) {
  const auto consumed = Consumed(allowance.recorded);

  QuantityMap remaining;
  for (const auto& [product, authorized] : allowance.authorized) {
    auto it            = consumed.find(product);
    remaining[product] = it == consumed.end() ? authorized : authorized - it->second;
  }
  return remaining;
}

void QuantityGuard::Check(const Allowance& allowance, const std::vector<ProposedLine>& proposed) {
  ValidateProposal(proposed);

  const auto remaining = Remaining(allowance);
  for (const auto& line : proposed) {
    auto it = remaining.find(line.product_id);
    if (it == remaining.end()) {
      throw util::UnknownProduct(line.product_id);
    }
    if (line.quantity > it->second) {
      throw util::QuantityExceeded(line.product_id, line.quantity, it->second);
    }
  }
}

} // namespace docflow::guard
