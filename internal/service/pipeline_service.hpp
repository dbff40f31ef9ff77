#pragma once

#include "shopstack/v1.hpp"
#include "internal/db/model/execution_record.hpp"
#include "internal/db/model/release_record.hpp"
#include "service_context.hpp"

namespace shopstack::service {

class PipelineService {
public:
  explicit PipelineService(ServiceContext ctx);

  shopstack::api::v1::TriggerResponse
  Trigger(const shopstack::api::v1::TriggerRequest& req);

  shopstack::api::v1::CancelResponse
  Cancel(const shopstack::api::v1::CancelRequest& req);

  shopstack::api::v1::GetExecutionResponse
  GetExecution(const shopstack::api::v1::GetExecutionRequest& req);

  shopstack::api::v1::ListExecutionsResponse
  ListExecutions(const shopstack::api::v1::ListExecutionsRequest& req);

  static shopstack::api::v1::PipelineExecution ToProto(const shopstack::db::model::ExecutionRecord& record);
  static shopstack::api::v1::Release           ToProto(const shopstack::db::model::ReleaseRecord& record);

private:
  shopstack::pipeline::PipelineOrchestrator& Orchestrator() const;

  ServiceContext ctx_;
};

}
