#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "common/fakes.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/pipeline_server.hpp"
#include "internal/grpc/topology_server.hpp"
#include "internal/pipeline/pipeline_orchestrator.hpp"
#include "internal/service/pipeline_service.hpp"
#include "internal/service/topology_service.hpp"
#include "internal/topology/topology_builder.hpp"
#include "shopstack/v1.hpp"

namespace {

using namespace std::chrono_literals;

shopstack::service::ServiceContext BuildServiceContext(bool with_pipeline) {
  const auto config = shopstack::config::ConfigLoader::LoadFromYamlString("");

  shopstack::service::ServiceContext ctx;
  ctx.topology = std::make_shared<const shopstack::topology::Topology>(
      shopstack::topology::TopologyBuilder::Build(config.topology(), config.pipeline()));
  if (!with_pipeline) return ctx;

  shopstack::pipeline::PipelineOptions options;
  options.name          = "WooCommercePipeline";
  options.branch        = "main";
  options.deploy.target = "products";

  auto source = std::make_shared<shopstack::testing::FakeSourceProvider>();
  source->fail = true;
  ctx.orchestrator = std::make_shared<shopstack::pipeline::PipelineOrchestrator>(
      options,
      shopstack::pipeline::Collaborators{source, std::make_shared<shopstack::testing::FakeBuildToolchain>(),
                                         std::make_shared<shopstack::testing::FakeFunctionDeployer>(), nullptr},
      std::make_shared<shopstack::db::memory::MemoryRepository>());
  ctx.orchestrator->Start();
  return ctx;
}

void TestGetMissingExecutionReturnsNotFound() {
  shopstack::grpc::PipelineServer server(std::make_shared<shopstack::service::PipelineService>(BuildServiceContext(true)));

  shopstack::api::v1::GetExecutionRequest req;
  req.mutable_id()->set_value("missing-execution");
  shopstack::api::v1::GetExecutionResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  const auto status = server.GetExecution(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCancelTerminalExecutionReturnsFailedPrecondition() {
  auto ctx = BuildServiceContext(true);
  shopstack::grpc::PipelineServer server(std::make_shared<shopstack::service::PipelineService>(ctx));

  shopstack::api::v1::TriggerRequest trigger;
  trigger.mutable_change()->set_branch("main");
  trigger.mutable_change()->set_revision("abc123");
  shopstack::api::v1::TriggerResponse triggered;
  ::grpc::ServerContext               trigger_ctx;
  assert(server.Trigger(&trigger_ctx, &trigger, &triggered).ok());

  const auto& id = triggered.execution().id().value();
  assert(ctx.orchestrator->WaitForTerminal(id, 10s));

  shopstack::api::v1::CancelRequest req;
  req.mutable_id()->set_value(id);
  shopstack::api::v1::CancelResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  const auto status = server.Cancel(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestDescribeReturnsOk() {
  shopstack::grpc::TopologyServer server(std::make_shared<shopstack::service::TopologyService>(BuildServiceContext(false)));

  shopstack::api::v1::DescribeTopologyRequest  req;
  shopstack::api::v1::DescribeTopologyResponse resp;
  ::grpc::ServerContext                        grpc_ctx;

  assert(server.Describe(&grpc_ctx, &req, &resp).ok());
  assert(resp.outputs_size() == 2);
}

void TestErrorMapping() {
  using shopstack::grpc::ToStatus;
  assert(ToStatus(shopstack::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(shopstack::util::CycleError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestGetMissingExecutionReturnsNotFound();
  TestCancelTerminalExecutionReturnsFailedPrecondition();
  TestDescribeReturnsOk();
  TestErrorMapping();

  std::cout << "shopstack_unit_grpc_status: pass\n";
  return 0;
}
