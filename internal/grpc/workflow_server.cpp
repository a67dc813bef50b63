#include "workflow_server.hpp"

#include "grpc_error.hpp"

namespace docflow::grpc {

WorkflowServer::WorkflowServer(std::shared_ptr<docflow::service::WorkflowService> svc)
    : service_(std::move(svc)) {}

::grpc::Status WorkflowServer::CreateQuotation(::grpc::ServerContext*,
                                   const docflow::v1::CreateQuotationRequest* req,
                                   docflow::v1::QuotationResponse* resp) {
  try {
    *resp = service_->CreateQuotation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::EditQuotation(::grpc::ServerContext*,
                                   const docflow::v1::EditQuotationRequest* req,
                                   docflow::v1::QuotationResponse* resp) {
  try {
    *resp = service_->EditQuotation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::SubmitQuotation(::grpc::ServerContext*,
                                   const docflow::v1::QuotationRequest* req,
                                   docflow::v1::QuotationResponse* resp) {
  try {
    *resp = service_->SubmitQuotation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::DecideApproval(::grpc::ServerContext*,
                                   const docflow::v1::DecideApprovalRequest* req,
                                   docflow::v1::QuotationResponse* resp) {
  try {
    *resp = service_->DecideApproval(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::MarkQuotationSending(::grpc::ServerContext*,
                                   const docflow::v1::QuotationRequest* req,
                                   docflow::v1::QuotationResponse* resp) {
  try {
    *resp = service_->MarkQuotationSending(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::MarkQuotationSent(::grpc::ServerContext*,
                                   const docflow::v1::QuotationRequest* req,
                                   docflow::v1::QuotationResponse* resp) {
  try {
    *resp = service_->MarkQuotationSent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::MarkQuotationAccepted(::grpc::ServerContext*,
                                   const docflow::v1::QuotationRequest* req,
                                   docflow::v1::QuotationResponse* resp) {
  try {
    *resp = service_->MarkQuotationAccepted(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::CreateQuotationVersion(::grpc::ServerContext*,
                                   const docflow::v1::QuotationRequest* req,
                                   docflow::v1::QuotationResponse* resp) {
  try {
    *resp = service_->CreateQuotationVersion(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::GetQuotation(::grpc::ServerContext*,
                                   const docflow::v1::QuotationRequest* req,
                                   docflow::v1::QuotationResponse* resp) {
  try {
    *resp = service_->GetQuotation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::CreateDelivery(::grpc::ServerContext*,
                                   const docflow::v1::CreateDeliveryRequest* req,
                                   docflow::v1::DeliveryResponse* resp) {
  try {
    *resp = service_->CreateDelivery(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::MarkDeliveryDelivered(::grpc::ServerContext*,
                                   const docflow::v1::DeliveryRequest* req,
                                   docflow::v1::DeliveryResponse* resp) {
  try {
    *resp = service_->MarkDeliveryDelivered(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::MarkDeliveryReturned(::grpc::ServerContext*,
                                   const docflow::v1::DeliveryRequest* req,
                                   docflow::v1::DeliveryResponse* resp) {
  try {
    *resp = service_->MarkDeliveryReturned(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::ReassignDelivery(::grpc::ServerContext*,
                                   const docflow::v1::ReassignDeliveryRequest* req,
                                   docflow::v1::DeliveryResponse* resp) {
  try {
    *resp = service_->ReassignDelivery(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::CreateInvoice(::grpc::ServerContext*,
                                   const docflow::v1::CreateInvoiceRequest* req,
                                   docflow::v1::InvoiceResponse* resp) {
  try {
    *resp = service_->CreateInvoice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::MarkInvoiceReturned(::grpc::ServerContext*,
                                   const docflow::v1::InvoiceRequest* req,
                                   docflow::v1::InvoiceResponse* resp) {
  try {
    *resp = service_->MarkInvoiceReturned(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::RecordPayment(::grpc::ServerContext*,
                                   const docflow::v1::RecordPaymentRequest* req,
                                   docflow::v1::RecordPaymentResponse* resp) {
  try {
    *resp = service_->RecordPayment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::GetInvoice(::grpc::ServerContext*,
                                   const docflow::v1::InvoiceRequest* req,
                                   docflow::v1::InvoiceResponse* resp) {
  try {
    *resp = service_->GetInvoice(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkflowServer::GetRemainingQuantities(::grpc::ServerContext*,
                                   const docflow::v1::GetRemainingQuantitiesRequest* req,
                                   docflow::v1::GetRemainingQuantitiesResponse* resp) {
  try {
    *resp = service_->GetRemainingQuantities(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
