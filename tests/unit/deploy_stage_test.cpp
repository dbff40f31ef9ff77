#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "common/fakes.hpp"
#include "internal/pipeline/deploy_stage.hpp"
#include "internal/pipeline/image_definitions.hpp"
#include "internal/util/errors.hpp"

namespace {

using shopstack::pipeline::CancellationToken;
using shopstack::pipeline::CancelReason;
using shopstack::pipeline::DeployMode;
using shopstack::pipeline::DeployStage;
using shopstack::pipeline::DeployStageOptions;
using shopstack::pipeline::FunctionOutcome;
using shopstack::pipeline::ImageDefinitions;
using shopstack::pipeline::PartialDeploymentError;
using shopstack::testing::FakeContainerOrchestrator;
using shopstack::testing::FakeFunctionDeployer;

DeployStageOptions FunctionOptions() {
  DeployStageOptions options;
  options.mode                = DeployMode::kFunction;
  options.target              = "products";
  options.function_identities = {{"productsFunctionArn", "arn:products"}, {"ordersFunctionArn", "arn:orders"}, {"cartFunctionArn", "arn:cart"}};
  return options;
}

DeployStageOptions ContainerOptions() {
  DeployStageOptions options;
  options.mode           = DeployMode::kContainer;
  options.target         = "WooCommerceService";
  options.container_name = "WooCommerceContainer";
  options.cluster        = "WooCommerceCluster";
  options.service        = "WooCommerceService";
  options.task_count     = 1;
  return options;
}

void TestFunctionDeployPassesIdentities() {
  auto        deployer = std::make_shared<FakeFunctionDeployer>();
  DeployStage stage(deployer, nullptr, FunctionOptions());

  const auto outcome = stage.Run("abc123", "workspace/abc123", CancellationToken());
  assert(outcome.running_artifact == "workspace/abc123");
  assert(deployer->targets.size() == 1);
  assert(deployer->targets[0] == "products");
  assert(deployer->last_parameters.size() == 3);
  assert(deployer->last_parameters.at("cartFunctionArn") == "arn:cart");
}

void TestMixedOutcomesArePartialDeployment() {
  auto deployer      = std::make_shared<FakeFunctionDeployer>();
  deployer->outcomes = {FunctionOutcome{"products", true, ""}, FunctionOutcome{"orders", false, "throttled"},
                        FunctionOutcome{"cart", true, ""}};
  DeployStage stage(deployer, nullptr, FunctionOptions());

  bool partial = false;
  try {
    stage.Run("abc123", "workspace/abc123", CancellationToken());
  } catch (const PartialDeploymentError& e) {
    partial = true;
    assert(e.failed().size() == 1);
    assert(e.failed()[0] == "orders");
  }
  assert(partial);
}

void TestAllFunctionsFailingIsAStageError() {
  auto deployer      = std::make_shared<FakeFunctionDeployer>();
  deployer->outcomes = {FunctionOutcome{"products", false, "boom"}, FunctionOutcome{"orders", false, "boom"}};
  DeployStage stage(deployer, nullptr, FunctionOptions());

  bool failed = false;
  try {
    stage.Run("abc123", "workspace/abc123", CancellationToken());
  } catch (const shopstack::util::PipelineStageError& e) {
    failed = true;
    assert(e.stage() == "Deploy");
    assert(e.phase() == "invoke");
  }
  assert(failed);
}

void TestInvokeFailureIsAStageError() {
  auto deployer  = std::make_shared<FakeFunctionDeployer>();
  deployer->fail = true;
  DeployStage stage(deployer, nullptr, FunctionOptions());

  bool failed = false;
  try {
    stage.Run("abc123", "workspace/abc123", CancellationToken());
  } catch (const shopstack::util::PipelineStageError&) {
    failed = true;
  }
  assert(failed);
}

void TestContainerRollingUpdateUsesDescriptor() {
  auto        orchestrator = std::make_shared<FakeContainerOrchestrator>();
  DeployStage stage(nullptr, orchestrator, ContainerOptions());

  const auto descriptor = ImageDefinitions::Serialize({{"WooCommerceContainer", "woocommerce-repo:abc123"}});
  const auto outcome    = stage.Run("abc123", descriptor, CancellationToken());

  assert(outcome.running_artifact == "woocommerce-repo:abc123");
  assert(orchestrator->requests.size() == 1);
  assert(orchestrator->requests[0].cluster == "WooCommerceCluster");
  assert(orchestrator->requests[0].service == "WooCommerceService");
  assert(orchestrator->requests[0].images[0].name == "WooCommerceContainer");
}

void TestInvalidDescriptorNeverReachesOrchestrator() {
  auto        orchestrator = std::make_shared<FakeContainerOrchestrator>();
  DeployStage stage(nullptr, orchestrator, ContainerOptions());

  bool rejected = false;
  try {
    stage.Run("abc123", R"([{"name":"WooCommerceContainer"}])", CancellationToken());
  } catch (const shopstack::util::DescriptorError&) {
    rejected = true;
  }
  assert(rejected);
  assert(orchestrator->requests.empty());
}

void TestRollingUpdateFailureIsAStageError() {
  auto orchestrator  = std::make_shared<FakeContainerOrchestrator>();
  orchestrator->fail = true;
  DeployStage stage(nullptr, orchestrator, ContainerOptions());

  bool failed = false;
  try {
    stage.Run("abc123", ImageDefinitions::Serialize({{"WooCommerceContainer", "woocommerce-repo:abc123"}}), CancellationToken());
  } catch (const shopstack::util::PipelineStageError& e) {
    failed = true;
    assert(e.phase() == "rolling_update");
  }
  assert(failed);
}

void TestCancelledTokenSkipsDeploy() {
  auto              deployer = std::make_shared<FakeFunctionDeployer>();
  DeployStage       stage(deployer, nullptr, FunctionOptions());
  CancellationToken token;
  token.Cancel(CancelReason::kTimeout);

  bool cancelled = false;
  try {
    stage.Run("abc123", "workspace/abc123", token);
  } catch (const shopstack::pipeline::OperationCancelled& e) {
    cancelled = true;
    assert(e.reason() == CancelReason::kTimeout);
  }
  assert(cancelled);
  assert(deployer->targets.empty());
}

void TestRestoreRollsContainerBack() {
  auto        orchestrator = std::make_shared<FakeContainerOrchestrator>();
  DeployStage stage(nullptr, orchestrator, ContainerOptions());

  stage.Restore("woocommerce-repo:r1", CancellationToken());
  assert(orchestrator->Running() == "woocommerce-repo:r1");
  assert(orchestrator->requests.size() == 1);
  assert(orchestrator->requests[0].images.size() == 1);
  assert(orchestrator->requests[0].images[0].name == "WooCommerceContainer");
  assert(orchestrator->requests[0].cluster == "WooCommerceCluster");

  orchestrator->fail = true;
  bool failed = false;
  try {
    stage.Restore("woocommerce-repo:r1", CancellationToken());
  } catch (const shopstack::util::PipelineStageError& e) {
    failed = true;
    assert(e.phase() == "restore");
  }
  assert(failed);
}

void TestRestoreReinvokesFunctionsWithEarlierArtifact() {
  auto        deployer = std::make_shared<FakeFunctionDeployer>();
  DeployStage stage(deployer, nullptr, FunctionOptions());

  stage.Restore("workspace/r1", CancellationToken());
  assert(deployer->targets.size() == 1);
  assert(deployer->last_parameters.size() == 3);

  deployer->outcomes = {FunctionOutcome{"products", true, ""}, FunctionOutcome{"orders", false, "throttled"}};
  bool failed        = false;
  try {
    stage.Restore("workspace/r1", CancellationToken());
  } catch (const shopstack::util::PipelineStageError& e) {
    failed = true;
    assert(e.phase() == "restore");
    assert(std::string(e.what()).find("orders") != std::string::npos);
  }
  assert(failed);
}

} // namespace

int main() {
  TestFunctionDeployPassesIdentities();
  TestMixedOutcomesArePartialDeployment();
  TestAllFunctionsFailingIsAStageError();
  TestInvokeFailureIsAStageError();
  TestContainerRollingUpdateUsesDescriptor();
  TestInvalidDescriptorNeverReachesOrchestrator();
  TestRollingUpdateFailureIsAStageError();
  TestCancelledTokenSkipsDeploy();
  TestRestoreRollsContainerBack();
  TestRestoreReinvokesFunctionsWithEarlierArtifact();

  std::cout << "shopstack_unit_deploy_stage: pass\n";
  return 0;
}
