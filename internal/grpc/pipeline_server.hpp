#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "shopstack/services/v1/shopstack_pipeline_service.grpc.pb.h"
#include "internal/service/pipeline_service.hpp"
#include "shopstack/v1.hpp"

namespace shopstack::grpc {

class PipelineServer final : public shopstack::services::v1::ShopstackPipelineService::Service {
public:
  explicit PipelineServer(std::shared_ptr<shopstack::service::PipelineService> svc);

  ::grpc::Status Trigger(::grpc::ServerContext*,
                         const shopstack::api::v1::TriggerRequest*,
                         shopstack::api::v1::TriggerResponse*) override;

  ::grpc::Status Cancel(::grpc::ServerContext*,
                        const shopstack::api::v1::CancelRequest*,
                        shopstack::api::v1::CancelResponse*) override;

  ::grpc::Status GetExecution(::grpc::ServerContext*,
                              const shopstack::api::v1::GetExecutionRequest*,
                              shopstack::api::v1::GetExecutionResponse*) override;

  ::grpc::Status ListExecutions(::grpc::ServerContext*,
                                const shopstack::api::v1::ListExecutionsRequest*,
                                shopstack::api::v1::ListExecutionsResponse*) override;

private:
  std::shared_ptr<shopstack::service::PipelineService> service_;
};

}
