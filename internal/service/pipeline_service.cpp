#include "pipeline_service.hpp"

#include <algorithm>

#include "internal/pipeline/pipeline_orchestrator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "rpc_observer.hpp"

namespace shopstack::service {

using namespace shopstack::api::v1;
using shopstack::model::PipelineStage;

namespace {

shopstack::api::v1::PipelineStage StageToProto(PipelineStage stage) {
  switch (stage) {
    case PipelineStage::kSource:
      return PIPELINE_STAGE_SOURCE;
    case PipelineStage::kBuild:
      return PIPELINE_STAGE_BUILD;
    case PipelineStage::kDeploy:
      return PIPELINE_STAGE_DEPLOY;
    case PipelineStage::kSucceeded:
      return PIPELINE_STAGE_SUCCEEDED;
    case PipelineStage::kFailed:
      return PIPELINE_STAGE_FAILED;
  }
  return PIPELINE_STAGE_UNSPECIFIED;
}

const std::string& RequireId(const ExecutionID& id) {
  if (id.value().empty()) {
    throw shopstack::util::InvalidState("execution id is required");
  }
  return id.value();
}

} // namespace

PipelineService::PipelineService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

shopstack::pipeline::PipelineOrchestrator& PipelineService::Orchestrator() const {
  if (!ctx_.orchestrator) {
    throw shopstack::util::InvalidState("this topology has no delivery pipeline");
  }
  return *ctx_.orchestrator;
}

PipelineExecution PipelineService::ToProto(const shopstack::db::model::ExecutionRecord& record) {
  PipelineExecution out;
  out.mutable_id()->set_value(record.id);
  out.set_pipeline(record.pipeline);
  out.mutable_trigger()->set_branch(record.branch);
  out.mutable_trigger()->set_revision(record.revision);
  out.set_stage(StageToProto(record.stage));
  out.set_queued(record.queued);
  out.set_source_artifact(record.source_artifact);
  out.set_build_artifact(record.build_artifact);
  if (record.failure) {
    auto* failure = out.mutable_failure();
    failure->set_stage(StageToProto(record.failure->stage));
    failure->set_phase(record.failure->phase);
    failure->set_message(record.failure->message);
    failure->set_kind(record.failure->kind);
  }
  out.set_partial_deployment(record.partial_deployment);
  *out.mutable_created_at() = shopstack::util::MillisToProto(record.created_at_ms);
  *out.mutable_updated_at() = shopstack::util::MillisToProto(record.updated_at_ms);
  return out;
}

Release PipelineService::ToProto(const shopstack::db::model::ReleaseRecord& record) {
  Release out;
  out.set_target(record.target);
  out.set_artifact(record.artifact);
  out.set_revision(record.revision);
  out.mutable_execution_id()->set_value(record.execution_id);
  *out.mutable_updated_at() = shopstack::util::MillisToProto(record.updated_at_ms);
  return out;
}

TriggerResponse PipelineService::Trigger(const TriggerRequest& req) {
  return ObserveRpc("PipelineService.Trigger", "", [&] {
    TriggerResponse resp;
    auto            execution = Orchestrator().Trigger({req.change().branch(), req.change().revision()});
    if (!execution) {
      resp.set_ignored(true);
      return resp;
    }
    *resp.mutable_execution() = ToProto(*execution);
    return resp;
  });
}

CancelResponse PipelineService::Cancel(const CancelRequest& req) {
  return ObserveRpc("PipelineService.Cancel", req.id().value(), [&] {
    CancelResponse resp;
    *resp.mutable_execution() = ToProto(Orchestrator().Cancel(RequireId(req.id())));
    return resp;
  });
}

GetExecutionResponse PipelineService::GetExecution(const GetExecutionRequest& req) {
  return ObserveRpc("PipelineService.GetExecution", req.id().value(), [&] {
    GetExecutionResponse resp;
    *resp.mutable_execution() = ToProto(Orchestrator().Get(RequireId(req.id())));
    return resp;
  });
}

ListExecutionsResponse PipelineService::ListExecutions(const ListExecutionsRequest& req) {
  return ObserveRpc("PipelineService.ListExecutions", "", [&] {
    ListExecutionsResponse resp;
    const size_t limit = req.limit() > 0 ? std::min(req.limit(), ctx_.history_limit) : ctx_.history_limit;
    for (const auto& record : Orchestrator().List(limit)) {
      *resp.add_executions() = ToProto(record);
    }
    for (const auto& release : Orchestrator().Releases()) {
      *resp.add_releases() = ToProto(release);
    }
    return resp;
  });
}

} // namespace shopstack::service
