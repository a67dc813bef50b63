#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace docflow::model {

// ------------------------------------------------------------------
// Quotation
// ------------------------------------------------------------------

enum class QuotationStatus : std::uint8_t {
  kDraft    = 1,
  kPending  = 2,
  kApproved = 3,
  kRejected = 4,
  kSending  = 5,
  kSent     = 6,
  kAccepted = 7,
};

enum class QuotationAction : std::uint8_t {
  kSubmitForApproval,
  kApprove,
  kReject,
  kMarkSending,
  kMarkSent,
  kMarkAccepted,
  kCreateNewVersion,
  kEdit,
};

// Which statuses admit new deliveries and invoices.
enum class MovementGate : std::uint8_t {
  kApprovedOrSent,
  kAcceptedOnly,
};

constexpr bool IsApproved(QuotationStatus status) {
  return status == QuotationStatus::kApproved || status == QuotationStatus::kSent || status == QuotationStatus::kAccepted;
}

constexpr bool PassesGate(MovementGate gate, QuotationStatus status) {
  if (gate == MovementGate::kAcceptedOnly) {
    return status == QuotationStatus::kAccepted;
  }
  return IsApproved(status);
}

constexpr bool CanApply(QuotationStatus from, QuotationAction action) {
  switch (action) {
    case QuotationAction::kSubmitForApproval:
    case QuotationAction::kEdit:
      return from == QuotationStatus::kDraft;
    case QuotationAction::kApprove:
    case QuotationAction::kReject:
      return from == QuotationStatus::kPending;
    case QuotationAction::kMarkSending:
    case QuotationAction::kMarkAccepted:
      return from == QuotationStatus::kApproved || from == QuotationStatus::kSent;
    case QuotationAction::kMarkSent:
      return from == QuotationStatus::kSending;
    case QuotationAction::kCreateNewVersion:
      return from == QuotationStatus::kApproved || from == QuotationStatus::kRejected || from == QuotationStatus::kSent ||
             from == QuotationStatus::kAccepted;
  }
  return false;
}

/*
  Status the acted-on row ends in.

  kCreateNewVersion leaves the source row untouched and yields the status
  of the new row (DRAFT). Throws util::InvalidTransition when the action
  is not legal from `from`, or when submitting a quotation that has no
  line items.
*/
QuotationStatus ApplyTransition(QuotationStatus from, QuotationAction action, std::size_t line_item_count = 0);

// ------------------------------------------------------------------
// Delivery / Invoice
// ------------------------------------------------------------------

enum class MovementStatus : std::uint8_t {
  kRecorded  = 1,
  kDelivered = 2,
  kReturned  = 3,
};

enum class MovementAction : std::uint8_t {
  kMarkDelivered,
  kMarkReturned,
};

// RETURNED movements stay in storage but no longer consume quotation quantity.
constexpr bool CountsTowardConsumption(MovementStatus status) {
  return status != MovementStatus::kReturned;
}

constexpr bool CanApply(MovementStatus from, MovementAction action) {
  if (action == MovementAction::kMarkReturned) {
    return true;
  }
  return from == MovementStatus::kRecorded;
}

MovementStatus ApplyTransition(MovementStatus from, MovementAction action);

// ------------------------------------------------------------------
// Names (logs, error messages, persisted text columns)
// ------------------------------------------------------------------

std::string_view ToString(QuotationStatus status);
std::string_view ToString(QuotationAction action);
std::string_view ToString(MovementStatus status);
std::string_view ToString(MovementAction action);

} // namespace docflow::model
