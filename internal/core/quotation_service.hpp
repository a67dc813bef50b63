#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/core/workflow_types.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/quotation_record.hpp"
#include "internal/lock/lock_service.hpp"
#include "internal/model/state_machine.hpp"

namespace docflow::core {

/*
  Quotation authoring and lifecycle.

  Status changes run under the quotation's lock so they serialize with
  delivery and invoice creation for the same quotation. Creating a
  quotation or a new version takes the project's lock instead, so version
  numbers stay unique per project on every backend, the in-memory one
  included.
*/
class QuotationService {
 public:
  QuotationService(std::shared_ptr<db::Repository> repository, std::shared_ptr<lock::LockService> locks);

  db::model::QuotationRecord CreateQuotation(std::uint64_t project_id, const std::vector<QuotationLineInput>& lines);

  // DRAFT only; replaces every line item.
  db::model::QuotationRecord EditQuotation(std::uint64_t quotation_id, const std::vector<QuotationLineInput>& lines);

  db::model::QuotationRecord Submit(std::uint64_t quotation_id);

  // Outcome of the external approval workflow for a PENDING quotation.
  db::model::QuotationRecord ApplyApprovalDecision(std::uint64_t quotation_id, bool approved);

  db::model::QuotationRecord MarkSending(std::uint64_t quotation_id);
  db::model::QuotationRecord MarkSent(std::uint64_t quotation_id);
  db::model::QuotationRecord MarkAccepted(std::uint64_t quotation_id);

  // Copies the source's line items into a new DRAFT row at
  // latest project version + 1. The source row is left as it is.
  db::model::QuotationRecord CreateNewVersion(std::uint64_t quotation_id);

  db::model::QuotationRecord                GetQuotation(std::uint64_t quotation_id);
  std::optional<db::model::QuotationRecord> FindLatestApprovedForProject(std::uint64_t project_id);

 private:
  db::model::QuotationRecord Transition(std::uint64_t quotation_id, model::QuotationAction action);

  db::model::QuotationRecord InsertNextVersion(std::uint64_t project_id, std::vector<db::model::QuotationLineRecord> lines);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<lock::LockService> locks_;
};

// Σ quantity × unit_price
util::Decimal QuotationTotal(const std::vector<db::model::QuotationLineRecord>& lines);

} // namespace docflow::core
