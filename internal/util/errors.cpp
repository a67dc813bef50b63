#include "internal/util/errors.hpp"

namespace docflow::util {

InvalidTransition::InvalidTransition(std::string from, std::string attempted, const std::string& detail)
    : std::runtime_error("cannot " + attempted + " from status " + from + (detail.empty() ? "" : ": " + detail)),
      from_(std::move(from)),
      attempted_(std::move(attempted)) {
}

QuantityExceeded::QuantityExceeded(std::string product_id, Decimal requested, Decimal remaining)
    : std::runtime_error("quantity exceeded for product " + product_id + ": requested " + requested.ToString() + ", remaining " +
                         remaining.ToString()),
      product_id_(std::move(product_id)),
      requested_(requested),
      remaining_(remaining) {
}

UnknownProduct::UnknownProduct(std::string product_id)
    : std::runtime_error("product " + product_id + " is not part of the quotation"), product_id_(std::move(product_id)) {
}

LockAcquisitionTimeout::LockAcquisitionTimeout(std::string lock_key)
    : std::runtime_error("another operation is in progress for " + lock_key + "; please try again"), lock_key_(std::move(lock_key)) {
}

bool IsRetryable(const std::exception& e) {
  if (dynamic_cast<const LockAcquisitionTimeout*>(&e)) {
    return true;
  }
  if (const auto* storage = dynamic_cast<const StorageError*>(&e)) {
    return storage->Busy();
  }
  return false;
}

} // namespace docflow::util
