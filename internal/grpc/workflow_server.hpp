#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "docflow/v1/workflow_service.grpc.pb.h"
#include "internal/service/workflow_service.hpp"

namespace docflow::grpc {

class WorkflowServer final : public docflow::v1::WorkflowService::Service {
public:
  explicit WorkflowServer(std::shared_ptr<docflow::service::WorkflowService> svc);

  ::grpc::Status CreateQuotation(::grpc::ServerContext*, const docflow::v1::CreateQuotationRequest*, docflow::v1::QuotationResponse*) override;
  ::grpc::Status EditQuotation(::grpc::ServerContext*, const docflow::v1::EditQuotationRequest*, docflow::v1::QuotationResponse*) override;
  ::grpc::Status SubmitQuotation(::grpc::ServerContext*, const docflow::v1::QuotationRequest*, docflow::v1::QuotationResponse*) override;
  ::grpc::Status DecideApproval(::grpc::ServerContext*, const docflow::v1::DecideApprovalRequest*, docflow::v1::QuotationResponse*) override;
  ::grpc::Status MarkQuotationSending(::grpc::ServerContext*, const docflow::v1::QuotationRequest*, docflow::v1::QuotationResponse*) override;
  ::grpc::Status MarkQuotationSent(::grpc::ServerContext*, const docflow::v1::QuotationRequest*, docflow::v1::QuotationResponse*) override;
  ::grpc::Status MarkQuotationAccepted(::grpc::ServerContext*, const docflow::v1::QuotationRequest*, docflow::v1::QuotationResponse*) override;
  ::grpc::Status CreateQuotationVersion(::grpc::ServerContext*, const docflow::v1::QuotationRequest*, docflow::v1::QuotationResponse*) override;
  ::grpc::Status GetQuotation(::grpc::ServerContext*, const docflow::v1::QuotationRequest*, docflow::v1::QuotationResponse*) override;
  ::grpc::Status CreateDelivery(::grpc::ServerContext*, const docflow::v1::CreateDeliveryRequest*, docflow::v1::DeliveryResponse*) override;
  ::grpc::Status MarkDeliveryDelivered(::grpc::ServerContext*, const docflow::v1::DeliveryRequest*, docflow::v1::DeliveryResponse*) override;
  ::grpc::Status MarkDeliveryReturned(::grpc::ServerContext*, const docflow::v1::DeliveryRequest*, docflow::v1::DeliveryResponse*) override;
  ::grpc::Status ReassignDelivery(::grpc::ServerContext*, const docflow::v1::ReassignDeliveryRequest*, docflow::v1::DeliveryResponse*) override;
  ::grpc::Status CreateInvoice(::grpc::ServerContext*, const docflow::v1::CreateInvoiceRequest*, docflow::v1::InvoiceResponse*) override;
  ::grpc::Status MarkInvoiceReturned(::grpc::ServerContext*, const docflow::v1::InvoiceRequest*, docflow::v1::InvoiceResponse*) override;
  ::grpc::Status RecordPayment(::grpc::ServerContext*, const docflow::v1::RecordPaymentRequest*, docflow::v1::RecordPaymentResponse*) override;
  ::grpc::Status GetInvoice(::grpc::ServerContext*, const docflow::v1::InvoiceRequest*, docflow::v1::InvoiceResponse*) override;
  ::grpc::Status GetRemainingQuantities(::grpc::ServerContext*, const docflow::v1::GetRemainingQuantitiesRequest*, docflow::v1::GetRemainingQuantitiesResponse*) override;

private:
  std::shared_ptr<docflow::service::WorkflowService> service_;
};

}
