#include "internal/model/state_machine.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace docflow::model {

QuotationStatus ApplyTransition(QuotationStatus from, QuotationAction action, std::size_t line_item_count) {
  if (!CanApply(from, action)) {
    throw util::InvalidTransition(std::string(ToString(from)), std::string(ToString(action)));
  }

  switch (action) {
    case QuotationAction::kSubmitForApproval:
      if (line_item_count == 0) {
        throw util::InvalidTransition(std::string(ToString(from)), std::string(ToString(action)), "quotation has no line items");
      }
      return QuotationStatus::kPending;
    case QuotationAction::kApprove:
      return QuotationStatus::kApproved;
    case QuotationAction::kReject:
      return QuotationStatus::kRejected;
    case QuotationAction::kMarkSending:
      return QuotationStatus::kSending;
    case QuotationAction::kMarkSent:
      return QuotationStatus::kSent;
    case QuotationAction::kMarkAccepted:
      return QuotationStatus::kAccepted;
    case QuotationAction::kCreateNewVersion:
    case QuotationAction::kEdit:
      return QuotationStatus::kDraft;
  }
  throw util::InvalidTransition(std::string(ToString(from)), std::string(ToString(action)));
}

MovementStatus ApplyTransition(MovementStatus from, MovementAction action) {
  if (!CanApply(from, action)) {
    throw util::InvalidTransition(std::string(ToString(from)), std::string(ToString(action)));
  }
  return action == MovementAction::kMarkReturned ? MovementStatus::kReturned : MovementStatus::kDelivered;
}

std::string_view ToString(QuotationStatus status) {
  switch (status) {
    case QuotationStatus::kDraft:
      return "DRAFT";
    case QuotationStatus::kPending:
      return "PENDING";
    case QuotationStatus::kApproved:
      return "APPROVED";
    case QuotationStatus::kRejected:
      return "REJECTED";
    case QuotationStatus::kSending:
      return "SENDING";
    case QuotationStatus::kSent:
      return "SENT";
    case QuotationStatus::kAccepted:
      return "ACCEPTED";
  }
  return "UNKNOWN";
}

std::string_view ToString(QuotationAction action) {
  switch (action) {
    case QuotationAction::kSubmitForApproval:
      return "submitForApproval";
    case QuotationAction::kApprove:
      return "approve";
    case QuotationAction::kReject:
      return "reject";
    case QuotationAction::kMarkSending:
      return "markSending";
    case QuotationAction::kMarkSent:
      return "markSent";
    case QuotationAction::kMarkAccepted:
      return "markAccepted";
    case QuotationAction::kCreateNewVersion:
      return "createNewVersion";
    case QuotationAction::kEdit:
      return "edit";
  }
  return "unknown";
}

std::string_view ToString(MovementStatus status) {
  switch (status) {
    case MovementStatus::kRecorded:
      return "RECORDED";
    case MovementStatus::kDelivered:
      return "DELIVERED";
    case MovementStatus::kReturned:
      return "RETURNED";
  }
  return "UNKNOWN";
}

std::string_view ToString(MovementAction action) {
  switch (action) {
    case MovementAction::kMarkDelivered:
      return "markDelivered";
    case MovementAction::kMarkReturned:
      return "markReturned";
  }
  return "unknown";
}

} // namespace docflow::model
