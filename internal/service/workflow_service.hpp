#pragma once

#include "docflow/v1.hpp"
#include "service_context.hpp"

namespace docflow::service {

/*
  Protobuf-facing workflow API.

  Converts wire messages to domain requests, runs the use case and
  converts the result back. Every call is traced, counted and logged on
  failure; exceptions propagate unchanged to the transport layer.
*/
class WorkflowService {
public:
  explicit WorkflowService(ServiceContext ctx);

  docflow::v1::QuotationResponse CreateQuotation(const docflow::v1::CreateQuotationRequest& req);
  docflow::v1::QuotationResponse EditQuotation(const docflow::v1::EditQuotationRequest& req);
  docflow::v1::QuotationResponse SubmitQuotation(const docflow::v1::QuotationRequest& req);
  docflow::v1::QuotationResponse DecideApproval(const docflow::v1::DecideApprovalRequest& req);
  docflow::v1::QuotationResponse MarkQuotationSending(const docflow::v1::QuotationRequest& req);
  docflow::v1::QuotationResponse MarkQuotationSent(const docflow::v1::QuotationRequest& req);
  docflow::v1::QuotationResponse MarkQuotationAccepted(const docflow::v1::QuotationRequest& req);
  docflow::v1::QuotationResponse CreateQuotationVersion(const docflow::v1::QuotationRequest& req);
  docflow::v1::QuotationResponse GetQuotation(const docflow::v1::QuotationRequest& req);

  docflow::v1::DeliveryResponse CreateDelivery(const docflow::v1::CreateDeliveryRequest& req);
  docflow::v1::DeliveryResponse MarkDeliveryDelivered(const docflow::v1::DeliveryRequest& req);
  docflow::v1::DeliveryResponse MarkDeliveryReturned(const docflow::v1::DeliveryRequest& req);
  docflow::v1::DeliveryResponse ReassignDelivery(const docflow::v1::ReassignDeliveryRequest& req);

  docflow::v1::InvoiceResponse       CreateInvoice(const docflow::v1::CreateInvoiceRequest& req);
  docflow::v1::InvoiceResponse       MarkInvoiceReturned(const docflow::v1::InvoiceRequest& req);
  docflow::v1::RecordPaymentResponse RecordPayment(const docflow::v1::RecordPaymentRequest& req);
  docflow::v1::InvoiceResponse       GetInvoice(const docflow::v1::InvoiceRequest& req);

  docflow::v1::GetRemainingQuantitiesResponse GetRemainingQuantities(const docflow::v1::GetRemainingQuantitiesRequest& req);

private:
  ServiceContext ctx_;
};

}
