#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using docflow::model::ApplyTransition;
using docflow::model::CanApply;
using docflow::model::MovementAction;
using docflow::model::MovementGate;
using docflow::model::MovementStatus;
using docflow::model::QuotationAction;
using docflow::model::QuotationStatus;

const std::vector<QuotationStatus> kAllStatuses = {QuotationStatus::kDraft,    QuotationStatus::kPending, QuotationStatus::kApproved,
                                                   QuotationStatus::kRejected, QuotationStatus::kSending, QuotationStatus::kSent,
                                                   QuotationStatus::kAccepted};

bool Rejects(QuotationStatus from, QuotationAction action, std::size_t lines = 1) {
  try {
    (void)ApplyTransition(from, action, lines);
  } catch (const docflow::util::InvalidTransition& e) {
    assert(e.From() == std::string(docflow::model::ToString(from)));
    assert(e.Attempted() == std::string(docflow::model::ToString(action)));
    return true;
  }
  return false;
}

void TestHappyPath() {
  auto status = QuotationStatus::kDraft;
  status      = ApplyTransition(status, QuotationAction::kSubmitForApproval, 2);
  assert(status == QuotationStatus::kPending);
  status = ApplyTransition(status, QuotationAction::kApprove);
  assert(status == QuotationStatus::kApproved);
  status = ApplyTransition(status, QuotationAction::kMarkSending);
  assert(status == QuotationStatus::kSending);
  status = ApplyTransition(status, QuotationAction::kMarkSent);
  assert(status == QuotationStatus::kSent);
  status = ApplyTransition(status, QuotationAction::kMarkAccepted);
  assert(status == QuotationStatus::kAccepted);
}

void TestRejectAndAcceptShortcut() {
  assert(ApplyTransition(QuotationStatus::kPending, QuotationAction::kReject) == QuotationStatus::kRejected);
  assert(ApplyTransition(QuotationStatus::kApproved, QuotationAction::kMarkAccepted) == QuotationStatus::kAccepted);
}

void TestSubmitRequiresLineItems() {
  assert(Rejects(QuotationStatus::kDraft, QuotationAction::kSubmitForApproval, 0));
}

void TestEveryIllegalPairIsRejected() {
  const std::vector<QuotationAction> actions = {QuotationAction::kSubmitForApproval, QuotationAction::kApprove,     QuotationAction::kReject,
                                                QuotationAction::kMarkSending,       QuotationAction::kMarkSent,    QuotationAction::kMarkAccepted,
                                                QuotationAction::kCreateNewVersion,  QuotationAction::kEdit};

  for (auto from : kAllStatuses) {
    for (auto action : actions) {
      if (CanApply(from, action)) {
        (void)ApplyTransition(from, action, 1);
      } else {
        assert(Rejects(from, action));
      }
    }
  }

  // accepted is terminal apart from versioning
  assert(Rejects(QuotationStatus::kAccepted, QuotationAction::kApprove));
  assert(Rejects(QuotationStatus::kAccepted, QuotationAction::kEdit));
  assert(Rejects(QuotationStatus::kSending, QuotationAction::kMarkAccepted));
  assert(Rejects(QuotationStatus::kPending, QuotationAction::kCreateNewVersion));
  assert(Rejects(QuotationStatus::kDraft, QuotationAction::kApprove));
}

void TestCreateNewVersionSources() {
  for (auto from : kAllStatuses) {
    const bool expected = from == QuotationStatus::kApproved || from == QuotationStatus::kRejected || from == QuotationStatus::kSent ||
                          from == QuotationStatus::kAccepted;
    assert(CanApply(from, QuotationAction::kCreateNewVersion) == expected);
    if (expected) {
      assert(ApplyTransition(from, QuotationAction::kCreateNewVersion) == QuotationStatus::kDraft);
    }
  }
}

void TestApprovedEquivalenceAndGate() {
  using docflow::model::IsApproved;
  using docflow::model::PassesGate;

  for (auto status : kAllStatuses) {
    const bool approved =
        status == QuotationStatus::kApproved || status == QuotationStatus::kSent || status == QuotationStatus::kAccepted;
    assert(IsApproved(status) == approved);
    assert(PassesGate(MovementGate::kApprovedOrSent, status) == approved);
    assert(PassesGate(MovementGate::kAcceptedOnly, status) == (status == QuotationStatus::kAccepted));
  }
  assert(!PassesGate(MovementGate::kApprovedOrSent, QuotationStatus::kSending));
}

void TestMovementTransitions() {
  using docflow::model::CountsTowardConsumption;

  assert(ApplyTransition(MovementStatus::kRecorded, MovementAction::kMarkDelivered) == MovementStatus::kDelivered);
  assert(ApplyTransition(MovementStatus::kRecorded, MovementAction::kMarkReturned) == MovementStatus::kReturned);
  assert(ApplyTransition(MovementStatus::kDelivered, MovementAction::kMarkReturned) == MovementStatus::kReturned);
  assert(ApplyTransition(MovementStatus::kReturned, MovementAction::kMarkReturned) == MovementStatus::kReturned);

  for (auto from : {MovementStatus::kDelivered, MovementStatus::kReturned}) {
    bool threw = false;
    try {
      (void)ApplyTransition(from, MovementAction::kMarkDelivered);
    } catch (const docflow::util::InvalidTransition&) {
      threw = true;
    }
    assert(threw);
  }

  assert(CountsTowardConsumption(MovementStatus::kRecorded));
  assert(CountsTowardConsumption(MovementStatus::kDelivered));
  assert(!CountsTowardConsumption(MovementStatus::kReturned));
}

} // namespace

int main() {
  TestHappyPath();
  TestRejectAndAcceptShortcut();
  TestSubmitRequiresLineItems();
  TestEveryIllegalPairIsRejected();
  TestCreateNewVersionSources();
  TestApprovedEquivalenceAndGate();
  TestMovementTransitions();

  std::cout << "docflow_unit_state_machine: pass\n";
  return 0;
}
