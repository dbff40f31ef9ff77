#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "shopstack/services/v1/shopstack_pipeline_service.grpc.pb.h"
#include "shopstack/services/v1/shopstack_topology_service.grpc.pb.h"
#include "shopstack/v1.hpp"

using namespace shopstack::api::v1;
using shopstack::services::v1::ShopstackPipelineService;
using shopstack::services::v1::ShopstackTopologyService;

static void Usage() {
  std::cout << "Usage:\n"
            << "  shopstackctl <addr> trigger <branch> <revision>\n"
            << "  shopstackctl <addr> cancel <execution_id>\n"
            << "  shopstackctl <addr> get <execution_id>\n"
            << "  shopstackctl <addr> list [limit]\n"
            << "  shopstackctl <addr> describe\n";
}

static const char* StageName(PipelineStage stage) {
  switch (stage) {
    case PIPELINE_STAGE_SOURCE:
      return "Source";
    case PIPELINE_STAGE_BUILD:
      return "Build";
    case PIPELINE_STAGE_DEPLOY:
      return "Deploy";
    case PIPELINE_STAGE_SUCCEEDED:
      return "Succeeded";
    case PIPELINE_STAGE_FAILED:
      return "Failed";
    default:
      return "Unknown";
  }
}

static void PrintExecution(const PipelineExecution& execution) {
  std::cout << "id=" << execution.id().value() << " revision=" << execution.trigger().revision() << " stage=" << StageName(execution.stage());
  if (execution.queued()) {
    std::cout << " queued";
  }
  if (execution.has_failure()) {
    std::cout << " failed_in=" << StageName(execution.failure().stage()) << " kind=" << execution.failure().kind();
    if (!execution.failure().phase().empty()) {
      std::cout << " phase=" << execution.failure().phase();
    }
    std::cout << " message=\"" << execution.failure().message() << "\"";
  }
  if (execution.partial_deployment()) {
    std::cout << " partial_deployment";
  }
  std::cout << "\n";
}

static ExecutionID MakeID(const std::string& value) {
  ExecutionID id;
  id.set_value(value);
  return id;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto pipeline_stub = ShopstackPipelineService::NewStub(channel);
  auto topology_stub = ShopstackTopologyService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "trigger") {
    if (argc < 5) return 1;

    TriggerRequest req;
    req.mutable_change()->set_branch(argv[3]);
    req.mutable_change()->set_revision(argv[4]);

    TriggerResponse resp;

    auto status = pipeline_stub->Trigger(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    if (resp.ignored()) {
      std::cout << "ignored: branch " << argv[3] << " is not watched\n";
      return 0;
    }
    PrintExecution(resp.execution());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    CancelResponse resp;

    auto status = pipeline_stub->Cancel(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintExecution(resp.execution());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetExecutionRequest req;
    *req.mutable_id() = MakeID(argv[3]);

    GetExecutionResponse resp;

    auto status = pipeline_stub->GetExecution(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    PrintExecution(resp.execution());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListExecutionsRequest req;
    if (argc >= 4) {
      req.set_limit(static_cast<uint32_t>(std::stoul(argv[3])));
    }

    ListExecutionsResponse resp;

    auto status = pipeline_stub->ListExecutions(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& execution : resp.executions()) {
      PrintExecution(execution);
    }
    for (const auto& release : resp.releases()) {
      std::cout << "release target=" << release.target() << " revision=" << release.revision() << " artifact=" << release.artifact() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "describe") {
    DescribeTopologyRequest  req;
    DescribeTopologyResponse resp;

    auto status = topology_stub->Describe(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "variant=" << resp.variant() << "\n";
    for (const auto& node : resp.nodes()) {
      std::cout << "node " << node.kind() << " " << node.name() << "\n";
    }
    for (const auto& edge : resp.edges()) {
      std::cout << "edge " << edge.from() << " -" << edge.relation() << "-> " << edge.to() << "\n";
    }
    for (const auto& grant : resp.grants()) {
      std::cout << "grant " << grant.principal() << " on " << grant.resource() << " (" << grant.actions_size() << " actions)\n";
    }
    for (const auto& rule : resp.routing_rules()) {
      std::cout << "route " << rule.path_pattern() << " -> " << rule.origin() << " cache=" << rule.cache_policy() << "\n";
    }
    for (const auto& output : resp.outputs()) {
      std::cout << output.key() << "=" << output.value() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
