#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/util/decimal.hpp"

namespace docflow::guard {

using QuantityMap = std::map<std::string, util::Decimal>;

struct ProposedLine {
  std::string   product_id;
  util::Decimal quantity;
};

// A delivery or invoice already persisted against the quotation.
struct RecordedMovement {
  QuantityMap quantities;
  bool        counted = true;  // false for RETURNED movements
};

/*
  Authorized quantities plus what has already been consumed against them.
  Built per movement kind (see allowance.hpp) and fed to the guard.
*/
struct Allowance {
  QuantityMap                   authorized;
  std::vector<RecordedMovement> recorded;
};

/*
  Remaining-quantity guard.

  Pure computation: no I/O, no locking. Callers run it inside the
  quotation's critical section so the recorded movements cannot change
  underneath it.
*/
class QuantityGuard {
 public:
  // Non-empty, no duplicate product, every quantity > 0.
  // Throws util::InvalidArgument.
  static void ValidateProposal(const std::vector<ProposedLine>& proposed);

  static QuantityMap Consumed(const std::vector<RecordedMovement>& recorded);

  // authorized - consumed for every authorized product (may be negative
  // after a manual reassignment).
  static QuantityMap Remaining(const Allowance& allowance);

  /*
    Validates the proposal, then each line independently:
      product must be authorized              -> util::UnknownProduct
      requested <= authorized - consumed      -> util::QuantityExceeded
    requested == remaining is accepted.
  */
  static void Check(const Allowance& allowance, const std::vector<ProposedLine>& proposed);
};

} // namespace docflow::guard
