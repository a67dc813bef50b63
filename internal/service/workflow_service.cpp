#include "workflow_service.hpp"

#include <chrono>
#include <string>
#include <vector>

#include "internal/core/quotation_service.hpp"
#include "internal/core/workflow_orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace docflow::service {

using namespace docflow::v1;

namespace {

// ------------------------------------------------------------------
// wire -> domain
// ------------------------------------------------------------------

util::Date DateOrToday(const std::string& text) {
  return text.empty() ? util::Today() : util::ParseDate(text);
}

std::vector<core::QuotationLineInput> ToLineInputs(const google::protobuf::RepeatedPtrField<QuotationLine>& lines) {
  std::vector<core::QuotationLineInput> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    out.push_back(core::QuotationLineInput{line.product_id(), util::Decimal::Parse(line.quantity()), util::Decimal::Parse(line.unit_price())});
  }
  return out;
}

std::vector<guard::ProposedLine> ToProposedLines(const google::protobuf::RepeatedPtrField<MovementLine>& lines) {
  std::vector<guard::ProposedLine> out;
  out.reserve(lines.size());
  for (const auto& line : lines) {
    out.push_back(guard::ProposedLine{line.product_id(), util::Decimal::Parse(line.quantity())});
  }
  return out;
}

// ------------------------------------------------------------------
// domain -> wire
// ------------------------------------------------------------------

Quotation ToProto(const db::model::QuotationRecord& record) {
  Quotation out;
  out.set_id(record.id);
  out.set_project_id(record.project_id);
  out.set_version(record.version);
  out.set_status(static_cast<QuotationStatus>(record.status));
  for (const auto& line : record.lines) {
    auto* wire = out.add_lines();
    wire->set_product_id(line.product_id);
    wire->set_quantity(line.quantity.ToString());
    wire->set_unit_price(line.unit_price.ToString());
  }
  out.set_total_amount(record.total_amount.ToString());
  out.set_created_at_ms(record.created_at_ms);
  out.set_updated_at_ms(record.updated_at_ms);
  return out;
}

Delivery ToProto(const db::model::DeliveryRecord& record) {
  Delivery out;
  out.set_id(record.id);
  out.set_project_id(record.project_id);
  if (record.quotation_id) {
    out.set_quotation_id(*record.quotation_id);
  }
  out.set_delivery_date(util::FormatDate(record.delivery_date));
  out.set_status(static_cast<MovementStatus>(record.status));
  out.set_notes(record.notes);
  for (const auto& line : record.lines) {
    auto* wire = out.add_lines();
    wire->set_product_id(line.product_id);
    wire->set_quantity(line.quantity.ToString());
  }
  out.set_created_at_ms(record.created_at_ms);
  return out;
}

Payment ToProto(const db::model::PaymentRecord& record) {
  Payment out;
  out.set_id(record.id);
  out.set_invoice_id(record.invoice_id);
  out.set_payment_date(util::FormatDate(record.payment_date));
  out.set_amount(record.amount.ToString());
  out.set_method(record.method);
  out.set_reference(record.reference);
  out.set_created_at_ms(record.created_at_ms);
  return out;
}

PaymentStatus ToProto(core::PaymentStatus status) {
  switch (status) {
    case core::PaymentStatus::kUnpaid:
      return PAYMENT_STATUS_UNPAID;
    case core::PaymentStatus::kPartiallyPaid:
      return PAYMENT_STATUS_PARTIALLY_PAID;
    case core::PaymentStatus::kPaid:
      return PAYMENT_STATUS_PAID;
  }
  return PAYMENT_STATUS_UNSPECIFIED;
}

Invoice ToProto(const core::InvoiceSummary& summary) {
  const auto& record = summary.invoice;

  Invoice out;
  out.set_id(record.id);
  out.set_invoice_number(record.invoice_number);
  out.set_project_id(record.project_id);
  if (record.quotation_id) {
    out.set_quotation_id(*record.quotation_id);
  }
  if (record.delivery_id) {
    out.set_delivery_id(*record.delivery_id);
  }
  out.set_issue_date(util::FormatDate(record.issue_date));
  out.set_due_date(util::FormatDate(record.due_date));
  out.set_status(static_cast<MovementStatus>(record.status));
  for (const auto& line : record.lines) {
    auto* wire = out.add_lines();
    wire->set_product_id(line.product_id);
    wire->set_quantity(line.quantity.ToString());
    wire->set_unit_price(line.unit_price.ToString());
    wire->set_amount(line.amount.ToString());
  }
  out.set_tax_rate(record.tax_rate.ToString());
  out.set_subtotal(record.subtotal.ToString());
  out.set_tax_amount(record.tax_amount.ToString());
  out.set_total_amount(record.total_amount.ToString());
  out.set_created_at_ms(record.created_at_ms);

  for (const auto& payment : summary.payments) {
    *out.add_payments() = ToProto(payment);
  }
  out.set_paid_amount(summary.paid_amount.ToString());
  out.set_remaining_balance(summary.remaining_balance.ToString());
  out.set_payment_status(ToProto(summary.payment_status));
  return out;
}

void AppendRemaining(const guard::QuantityMap& remaining, google::protobuf::RepeatedPtrField<RemainingQuantity>* out) {
  for (const auto& [product_id, quantity] : remaining) {
    auto* wire = out->Add();
    wire->set_product_id(product_id);
    wire->set_remaining(quantity.ToString());
  }
}

// ------------------------------------------------------------------
// tracing / metrics wrapper
// ------------------------------------------------------------------

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view id_key, std::uint64_t id, Fn&& fn) {
  docflow::observability::SpanScope span(route);
  if (id != 0) {
    span.SetAttribute(id_key, static_cast<std::int64_t>(id));
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };
  try {
    auto result = fn();
    docflow::observability::Metrics::Instance().RecordRequest(route, true);
    docflow::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    // caller mistakes are expected traffic; only storage trouble is an error
    if (dynamic_cast<const util::StorageError*>(&ex)) {
      DOCFLOW_LOG_ERROR("RPC failed", {docflow::observability::StringField("route", route), docflow::observability::StringField("error", ex.what()),
                                       docflow::observability::IntField(id_key, static_cast<std::int64_t>(id))});
    } else {
      DOCFLOW_LOG_INFO("RPC rejected", {docflow::observability::StringField("route", route), docflow::observability::StringField("error", ex.what()),
                                        docflow::observability::BoolField("retryable", util::IsRetryable(ex)),
                                        docflow::observability::IntField(id_key, static_cast<std::int64_t>(id))});
    }
    docflow::observability::Metrics::Instance().RecordRequest(route, false);
    docflow::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

QuotationResponse WrapQuotation(const db::model::QuotationRecord& record) {
  QuotationResponse resp;
  *resp.mutable_quotation() = ToProto(record);
  return resp;
}

DeliveryResponse WrapDelivery(const db::model::DeliveryRecord& record) {
  DeliveryResponse resp;
  *resp.mutable_delivery() = ToProto(record);
  return resp;
}

} // namespace

WorkflowService::WorkflowService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------------
// Quotations
// ------------------------------------------------------------------

QuotationResponse WorkflowService::CreateQuotation(const CreateQuotationRequest& req) {
  return ObserveRpc("WorkflowService.CreateQuotation", "project.id", req.project_id(),
                    [&] { return WrapQuotation(ctx_.quotations->CreateQuotation(req.project_id(), ToLineInputs(req.lines()))); });
}

QuotationResponse WorkflowService::EditQuotation(const EditQuotationRequest& req) {
  return ObserveRpc("WorkflowService.EditQuotation", "quotation.id", req.quotation_id(),
                    [&] { return WrapQuotation(ctx_.quotations->EditQuotation(req.quotation_id(), ToLineInputs(req.lines()))); });
}

QuotationResponse WorkflowService::SubmitQuotation(const QuotationRequest& req) {
  return ObserveRpc("WorkflowService.SubmitQuotation", "quotation.id", req.quotation_id(),
                    [&] { return WrapQuotation(ctx_.quotations->Submit(req.quotation_id())); });
}

QuotationResponse WorkflowService::DecideApproval(const DecideApprovalRequest& req) {
  return ObserveRpc("WorkflowService.DecideApproval", "quotation.id", req.quotation_id(),
                    [&] { return WrapQuotation(ctx_.quotations->ApplyApprovalDecision(req.quotation_id(), req.approved())); });
}

QuotationResponse WorkflowService::MarkQuotationSending(const QuotationRequest& req) {
  return ObserveRpc("WorkflowService.MarkQuotationSending", "quotation.id", req.quotation_id(),
                    [&] { return WrapQuotation(ctx_.quotations->MarkSending(req.quotation_id())); });
}

QuotationResponse WorkflowService::MarkQuotationSent(const QuotationRequest& req) {
  return ObserveRpc("WorkflowService.MarkQuotationSent", "quotation.id", req.quotation_id(),
                    [&] { return WrapQuotation(ctx_.quotations->MarkSent(req.quotation_id())); });
}

QuotationResponse WorkflowService::MarkQuotationAccepted(const QuotationRequest& req) {
  return ObserveRpc("WorkflowService.MarkQuotationAccepted", "quotation.id", req.quotation_id(),
                    [&] { return WrapQuotation(ctx_.quotations->MarkAccepted(req.quotation_id())); });
}

QuotationResponse WorkflowService::CreateQuotationVersion(const QuotationRequest& req) {
  return ObserveRpc("WorkflowService.CreateQuotationVersion", "quotation.id", req.quotation_id(),
                    [&] { return WrapQuotation(ctx_.quotations->CreateNewVersion(req.quotation_id())); });
}

QuotationResponse WorkflowService::GetQuotation(const QuotationRequest& req) {
  return ObserveRpc("WorkflowService.GetQuotation", "quotation.id", req.quotation_id(),
                    [&] { return WrapQuotation(ctx_.quotations->GetQuotation(req.quotation_id())); });
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

DeliveryResponse WorkflowService::CreateDelivery(const CreateDeliveryRequest& req) {
  return ObserveRpc("WorkflowService.CreateDelivery", "quotation.id", req.quotation_id(), [&] {
    core::CreateDeliveryRequest request;
    request.delivery_date = DateOrToday(req.delivery_date());
    request.notes         = req.notes();
    request.lines         = ToProposedLines(req.lines());
    return WrapDelivery(ctx_.orchestrator->CreateDelivery(req.quotation_id(), request));
  });
}

DeliveryResponse WorkflowService::MarkDeliveryDelivered(const DeliveryRequest& req) {
  return ObserveRpc("WorkflowService.MarkDeliveryDelivered", "delivery.id", req.delivery_id(),
                    [&] { return WrapDelivery(ctx_.orchestrator->MarkDeliveryDelivered(req.delivery_id())); });
}

DeliveryResponse WorkflowService::MarkDeliveryReturned(const DeliveryRequest& req) {
  return ObserveRpc("WorkflowService.MarkDeliveryReturned", "delivery.id", req.delivery_id(),
                    [&] { return WrapDelivery(ctx_.orchestrator->MarkDeliveryReturned(req.delivery_id())); });
}

DeliveryResponse WorkflowService::ReassignDelivery(const ReassignDeliveryRequest& req) {
  return ObserveRpc("WorkflowService.ReassignDelivery", "delivery.id", req.delivery_id(),
                    [&] { return WrapDelivery(ctx_.orchestrator->ReassignDelivery(req.delivery_id(), req.target_quotation_id())); });
}

// ------------------------------------------------------------------
// Invoices
// ------------------------------------------------------------------

InvoiceResponse WorkflowService::CreateInvoice(const CreateInvoiceRequest& req) {
  return ObserveRpc("WorkflowService.CreateInvoice", "quotation.id", req.quotation_id(), [&] {
    core::CreateInvoiceRequest request;
    request.issue_date = DateOrToday(req.issue_date());
    request.due_date   = req.due_date().empty() ? request.issue_date : util::ParseDate(req.due_date());
    if (req.has_delivery_id()) {
      request.delivery_id = req.delivery_id();
    }
    if (!req.tax_rate().empty()) {
      request.tax_rate = util::Decimal::Parse(req.tax_rate());
    }
    request.lines = ToProposedLines(req.lines());

    const auto created = ctx_.orchestrator->CreateInvoice(req.quotation_id(), request);

    InvoiceResponse resp;
    *resp.mutable_invoice() = ToProto(ctx_.orchestrator->GetInvoice(created.id));
    return resp;
  });
}

InvoiceResponse WorkflowService::MarkInvoiceReturned(const InvoiceRequest& req) {
  return ObserveRpc("WorkflowService.MarkInvoiceReturned", "invoice.id", req.invoice_id(), [&] {
    ctx_.orchestrator->MarkInvoiceReturned(req.invoice_id());

    InvoiceResponse resp;
    *resp.mutable_invoice() = ToProto(ctx_.orchestrator->GetInvoice(req.invoice_id()));
    return resp;
  });
}

RecordPaymentResponse WorkflowService::RecordPayment(const RecordPaymentRequest& req) {
  return ObserveRpc("WorkflowService.RecordPayment", "invoice.id", req.invoice_id(), [&] {
    core::PaymentRequest request;
    request.payment_date = DateOrToday(req.payment_date());
    request.amount       = util::Decimal::Parse(req.amount());
    request.method       = req.method();
    request.reference    = req.reference();

    RecordPaymentResponse resp;
    *resp.mutable_payment() = ToProto(ctx_.orchestrator->RecordPayment(req.invoice_id(), request));
    *resp.mutable_invoice() = ToProto(ctx_.orchestrator->GetInvoice(req.invoice_id()));
    return resp;
  });
}

InvoiceResponse WorkflowService::GetInvoice(const InvoiceRequest& req) {
  return ObserveRpc("WorkflowService.GetInvoice", "invoice.id", req.invoice_id(), [&] {
    InvoiceResponse resp;
    *resp.mutable_invoice() = ToProto(ctx_.orchestrator->GetInvoice(req.invoice_id()));
    return resp;
  });
}

// ------------------------------------------------------------------
// Read models
// ------------------------------------------------------------------

GetRemainingQuantitiesResponse WorkflowService::GetRemainingQuantities(const GetRemainingQuantitiesRequest& req) {
  return ObserveRpc("WorkflowService.GetRemainingQuantities", "quotation.id", req.quotation_id(), [&] {
    GetRemainingQuantitiesResponse resp;
    AppendRemaining(ctx_.orchestrator->RemainingDeliverable(req.quotation_id()), resp.mutable_deliverable());
    AppendRemaining(ctx_.orchestrator->RemainingInvoiceable(req.quotation_id()), resp.mutable_invoiceable());
    return resp;
  });
}

} // namespace docflow::service
