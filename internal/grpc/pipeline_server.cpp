#include "pipeline_server.hpp"
#include "grpc_error.hpp"

namespace shopstack::grpc {

PipelineServer::PipelineServer(std::shared_ptr<shopstack::service::PipelineService> svc)
    : service_(std::move(svc)) {}

::grpc::Status PipelineServer::Trigger(::grpc::ServerContext*,
                                       const shopstack::api::v1::TriggerRequest* req,
                                       shopstack::api::v1::TriggerResponse* resp) {
  try {
    *resp = service_->Trigger(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PipelineServer::Cancel(::grpc::ServerContext*,
                                      const shopstack::api::v1::CancelRequest* req,
                                      shopstack::api::v1::CancelResponse* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PipelineServer::GetExecution(::grpc::ServerContext*,
                                            const shopstack::api::v1::GetExecutionRequest* req,
                                            shopstack::api::v1::GetExecutionResponse* resp) {
  try {
    *resp = service_->GetExecution(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status PipelineServer::ListExecutions(::grpc::ServerContext*,
                                              const shopstack::api::v1::ListExecutionsRequest* req,
                                              shopstack::api::v1::ListExecutionsResponse* resp) {
  try {
    *resp = service_->ListExecutions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
