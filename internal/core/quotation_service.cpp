#include "quotation_service.hpp"

#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace docflow::core {

using docflow::observability::IntField;
using docflow::observability::StringField;
using docflow::db::model::QuotationLineRecord;
using docflow::db::model::QuotationRecord;

namespace {

std::vector<QuotationLineRecord> ToLineRecords(const std::vector<QuotationLineInput>& lines) {
  if (lines.empty()) {
    throw util::InvalidArgument("a quotation needs at least one line item");
  }

  std::vector<QuotationLineRecord> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    if (line.product_id.empty()) {
      throw util::InvalidArgument("quotation line is missing a product");
    }
    if (!line.quantity.IsPositive()) {
      throw util::InvalidArgument("quantity for product " + line.product_id + " must be greater than zero, got " + line.quantity.ToString());
    }
    if (line.unit_price.IsNegative()) {
      throw util::InvalidArgument("unit price for product " + line.product_id + " must not be negative, got " + line.unit_price.ToString());
    }
    out.push_back(QuotationLineRecord{line.product_id, line.quantity, line.unit_price});
  }
  return out;
}

QuotationRecord Require(db::Repository& repository, db::Transaction& tx, std::uint64_t quotation_id) {
  auto quotation = repository.GetQuotation(tx, quotation_id);
  if (!quotation) {
    throw util::NotFound("quotation " + std::to_string(quotation_id) + " not found");
  }
  return *std::move(quotation);
}

} // namespace

util::Decimal QuotationTotal(const std::vector<QuotationLineRecord>& lines) {
  util::Decimal total;
  for (const auto& line : lines) {
    total += line.quantity.Multiply(line.unit_price);
  }
  return total;
}

QuotationService::QuotationService(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockService> locks)
    : repository_(std::move(repository)), locks_(std::move(locks)) {
}

QuotationRecord QuotationService::InsertNextVersion(std::uint64_t project_id, std::vector<QuotationLineRecord> lines) {
  // reading latest + 1 and inserting must not interleave with another creator
  return locks_->WithProjectLock(project_id, [&] {
    auto tx = repository_->Begin();

    const auto now = util::ToUnixMillis(util::Now());

    QuotationRecord quotation;
    quotation.project_id    = project_id;
    quotation.version       = repository_->GetLatestQuotationVersion(*tx, project_id).value_or(0) + 1;
    quotation.status        = model::QuotationStatus::kDraft;
    quotation.lines         = std::move(lines);
    quotation.total_amount  = QuotationTotal(quotation.lines);
    quotation.created_at_ms = now;
    quotation.updated_at_ms = now;

    db::ThrowIfFailed(repository_->InsertQuotation(*tx, quotation), "create quotation");
    tx->Commit();
    return quotation;
  });
}

QuotationRecord QuotationService::CreateQuotation(std::uint64_t project_id, const std::vector<QuotationLineInput>& lines) {
  if (project_id == 0) {
    throw util::InvalidArgument("project id is required");
  }
  auto quotation = InsertNextVersion(project_id, ToLineRecords(lines));
  DOCFLOW_LOG_DEBUG("quotation created", {IntField("quotation_id", static_cast<std::int64_t>(quotation.id)),
                                          IntField("project_id", static_cast<std::int64_t>(project_id)),
                                          IntField("version", quotation.version)});
  return quotation;
}

QuotationRecord QuotationService::EditQuotation(std::uint64_t quotation_id, const std::vector<QuotationLineInput>& lines) {
  auto replacement = ToLineRecords(lines);

  return locks_->WithQuotationLock(quotation_id, [&] {
    auto tx        = repository_->Begin();
    auto quotation = Require(*repository_, *tx, quotation_id);

    quotation.status        = model::ApplyTransition(quotation.status, model::QuotationAction::kEdit);
    quotation.lines         = std::move(replacement);
    quotation.total_amount  = QuotationTotal(quotation.lines);
    quotation.updated_at_ms = util::ToUnixMillis(util::Now());

    db::ThrowIfFailed(repository_->UpdateQuotation(*tx, quotation), "edit quotation");
    tx->Commit();
    return quotation;
  });
}

QuotationRecord QuotationService::Transition(std::uint64_t quotation_id, model::QuotationAction action) {
  return locks_->WithQuotationLock(quotation_id, [&] {
    auto tx        = repository_->Begin();
    auto quotation = Require(*repository_, *tx, quotation_id);

    const auto from         = quotation.status;
    quotation.status        = model::ApplyTransition(from, action, quotation.lines.size());
    quotation.updated_at_ms = util::ToUnixMillis(util::Now());

    db::ThrowIfFailed(repository_->UpdateQuotation(*tx, quotation), "update quotation status");
    tx->Commit();

    DOCFLOW_LOG_DEBUG("quotation status changed", {IntField("quotation_id", static_cast<std::int64_t>(quotation_id)),
                                                   StringField("from", model::ToString(from)), StringField("to", model::ToString(quotation.status))});
    return quotation;
  });
}

QuotationRecord QuotationService::Submit(std::uint64_t quotation_id) {
  return Transition(quotation_id, model::QuotationAction::kSubmitForApproval);
}

QuotationRecord QuotationService::ApplyApprovalDecision(std::uint64_t quotation_id, bool approved) {
  return Transition(quotation_id, approved ? model::QuotationAction::kApprove : model::QuotationAction::kReject);
}

QuotationRecord QuotationService::MarkSending(std::uint64_t quotation_id) {
  return Transition(quotation_id, model::QuotationAction::kMarkSending);
}

QuotationRecord QuotationService::MarkSent(std::uint64_t quotation_id) {
  return Transition(quotation_id, model::QuotationAction::kMarkSent);
}

QuotationRecord QuotationService::MarkAccepted(std::uint64_t quotation_id) {
  return Transition(quotation_id, model::QuotationAction::kMarkAccepted);
}

QuotationRecord QuotationService::CreateNewVersion(std::uint64_t quotation_id) {
  const auto source = GetQuotation(quotation_id);
  if (!model::CanApply(source.status, model::QuotationAction::kCreateNewVersion)) {
    throw util::InvalidTransition(std::string(model::ToString(source.status)), std::string(model::ToString(model::QuotationAction::kCreateNewVersion)),
                                  "the source row keeps its status; only decided or sent quotations are versioned");
  }

  auto next = InsertNextVersion(source.project_id, source.lines);
  DOCFLOW_LOG_INFO("quotation versioned", {IntField("source_id", static_cast<std::int64_t>(quotation_id)),
                                           IntField("quotation_id", static_cast<std::int64_t>(next.id)), IntField("version", next.version)});
  return next;
}

QuotationRecord QuotationService::GetQuotation(std::uint64_t quotation_id) {
  auto tx        = repository_->Begin();
  auto quotation = Require(*repository_, *tx, quotation_id);
  tx->Commit();
  return quotation;
}

std::optional<QuotationRecord> QuotationService::FindLatestApprovedForProject(std::uint64_t project_id) {
  auto tx     = repository_->Begin();
  auto latest = repository_->FindLatestApprovedForProject(*tx, project_id);
  tx->Commit();
  return latest;
}

} // namespace docflow::core
