#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "common/fakes.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/pipeline/pipeline_orchestrator.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using shopstack::db::model::ExecutionRecord;
using shopstack::model::PipelineStage;
using shopstack::pipeline::BuildPhase;
using shopstack::pipeline::DeployMode;
using shopstack::pipeline::FunctionOutcome;
using shopstack::pipeline::ImageDefinition;
using shopstack::pipeline::PipelineOptions;
using shopstack::pipeline::PipelineOrchestrator;
using shopstack::testing::Gate;

constexpr auto kWait = 10s;

PipelineOptions Options() {
  PipelineOptions options;
  options.name                        = "WooCommercePipeline";
  options.branch                      = "main";
  options.timeouts.source             = 5s;
  options.timeouts.build              = 5s;
  options.timeouts.deploy             = 5s;
  options.build.repository_uri        = "woocommerce-repo";
  options.build.region                = "us-east-1";
  options.deploy.target               = "products";
  options.deploy.function_identities = {{"productsFunctionArn", "arn:products"}, {"ordersFunctionArn", "arn:orders"}};
  return options;
}

PipelineOptions ContainerOptions() {
  auto options                  = Options();
  options.build.container_name  = "WooCommerceContainer";
  options.deploy.mode           = DeployMode::kContainer;
  options.deploy.target         = "WooCommerceService";
  options.deploy.container_name = "WooCommerceContainer";
  options.deploy.cluster        = "WooCommerceCluster";
  options.deploy.service        = "WooCommerceService";
  options.deploy.task_count     = 1;
  options.deploy.function_identities.clear();
  return options;
}

struct Fixture {
  explicit Fixture(PipelineOptions options = Options(), std::shared_ptr<shopstack::db::Repository> repo = nullptr) {
    repository   = repo ? repo : std::make_shared<shopstack::db::memory::MemoryRepository>();
    source       = std::make_shared<shopstack::testing::FakeSourceProvider>();
    toolchain    = std::make_shared<shopstack::testing::FakeBuildToolchain>();
    functions    = std::make_shared<shopstack::testing::FakeFunctionDeployer>();
    containers   = std::make_shared<shopstack::testing::FakeContainerOrchestrator>();
    orchestrator = std::make_unique<PipelineOrchestrator>(
        std::move(options), shopstack::pipeline::Collaborators{source, toolchain, functions, containers}, repository);
  }

  ExecutionRecord TriggerMain(const std::string& revision) {
    auto record = orchestrator->Trigger({"main", revision});
    assert(record.has_value());
    return *record;
  }

  ExecutionRecord AwaitTerminal(const std::string& id) {
    assert(orchestrator->WaitForTerminal(id, kWait));
    return orchestrator->Get(id);
  }

  std::shared_ptr<shopstack::db::Repository>                     repository;
  std::shared_ptr<shopstack::testing::FakeSourceProvider>        source;
  std::shared_ptr<shopstack::testing::FakeBuildToolchain>        toolchain;
  std::shared_ptr<shopstack::testing::FakeFunctionDeployer>      functions;
  std::shared_ptr<shopstack::testing::FakeContainerOrchestrator> containers;
  std::unique_ptr<PipelineOrchestrator>                          orchestrator;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestHappyPathRecordsRelease() {
  Fixture f;
  f.orchestrator->Start();

  const auto queued = f.TriggerMain("abc123");
  assert(queued.stage == PipelineStage::kSource);
  assert(queued.queued);

  const auto done = f.AwaitTerminal(queued.id);
  assert(done.stage == PipelineStage::kSucceeded);
  assert(!done.failure.has_value());
  assert(!done.queued);
  assert(done.source_artifact == "workspace/abc123");
  assert(done.build_artifact == "workspace/abc123");

  const auto releases = f.orchestrator->Releases();
  assert(releases.size() == 1);
  assert(releases[0].target == "products");
  assert(releases[0].revision == "abc123");
  assert(releases[0].artifact == "workspace/abc123");
  assert(releases[0].execution_id == queued.id);

  assert(f.functions->targets.size() == 1);
  assert(f.functions->last_parameters.at("ordersFunctionArn") == "arn:orders");
}

void TestTriggerDuringBuildQueuesBehindActive() {
  Gate    install;
  Fixture f;
  f.toolchain->gates[BuildPhase::kInstall] = &install;
  f.orchestrator->Start();

  const auto first = f.TriggerMain("rev-1");
  assert(install.WaitEntered(kWait));

  const auto second = f.TriggerMain("rev-2");
  const auto waiting = f.orchestrator->Get(second.id);
  assert(waiting.queued);
  assert(waiting.stage == PipelineStage::kSource);
  assert(f.orchestrator->Get(first.id).stage == PipelineStage::kBuild);

  install.Open();
  assert(f.AwaitTerminal(first.id).stage == PipelineStage::kSucceeded);
  assert(f.AwaitTerminal(second.id).stage == PipelineStage::kSucceeded);

  assert((f.toolchain->InstalledRevisions() == std::vector<std::string>{"rev-1", "rev-2"}));
  assert(f.orchestrator->Releases()[0].revision == "rev-2");

  // newest first
  const auto history = f.orchestrator->List(0);
  assert(history.size() == 2);
  assert(history[0].id == second.id);
  assert(f.orchestrator->List(1).size() == 1);
}

void TestCancelQueuedExecution() {
  Gate    install;
  Fixture f;
  f.toolchain->gates[BuildPhase::kInstall] = &install;
  f.orchestrator->Start();

  const auto first = f.TriggerMain("rev-1");
  assert(install.WaitEntered(kWait));
  const auto second = f.TriggerMain("rev-2");

  const auto cancelled = f.orchestrator->Cancel(second.id);
  assert(cancelled.stage == PipelineStage::kFailed);
  assert(cancelled.failure->kind == "cancelled");
  assert(!cancelled.queued);

  install.Open();
  assert(f.AwaitTerminal(first.id).stage == PipelineStage::kSucceeded);
  assert(f.source->Fetched() == std::vector<std::string>{"rev-1"});
  assert(Throws<shopstack::util::InvalidState>([&] { f.orchestrator->Cancel(second.id); }));
}

void TestCancelDuringBuild() {
  Gate    install;
  Fixture f;
  f.toolchain->gates[BuildPhase::kInstall] = &install;
  f.orchestrator->Start();

  const auto execution = f.TriggerMain("abc123");
  assert(install.WaitEntered(kWait));

  const auto requested = f.orchestrator->Cancel(execution.id);
  assert(requested.stage == PipelineStage::kBuild);

  const auto done = f.AwaitTerminal(execution.id);
  assert(done.stage == PipelineStage::kFailed);
  assert(done.failure->stage == PipelineStage::kBuild);
  assert(done.failure->phase == "install");
  assert(done.failure->kind == "cancelled");
  assert(f.orchestrator->Releases().empty());
  assert(f.functions->targets.empty());
}

void TestCancelDuringDeployIsRejected() {
  Gate    invoke;
  Fixture f;
  f.functions->gate = &invoke;
  f.orchestrator->Start();

  const auto execution = f.TriggerMain("abc123");
  assert(invoke.WaitEntered(kWait));

  assert(Throws<shopstack::util::InvalidState>([&] { f.orchestrator->Cancel(execution.id); }));
  assert(f.orchestrator->Get(execution.id).stage == PipelineStage::kDeploy);

  invoke.Open();
  assert(f.AwaitTerminal(execution.id).stage == PipelineStage::kSucceeded);
}

void TestStageTimeout() {
  Gate fetch;
  auto options            = Options();
  options.timeouts.source = 100ms;
  Fixture f(options);
  f.source->gate = &fetch;
  f.orchestrator->Start();

  const auto done = f.AwaitTerminal(f.TriggerMain("abc123").id);
  assert(done.stage == PipelineStage::kFailed);
  assert(done.failure->stage == PipelineStage::kSource);
  assert(done.failure->kind == "timeout");
  assert(f.toolchain->Phases().empty());
}

/*
  The rollout keeps going after the deadline and lands the new image. The
  orchestrator must put the last released image back and keep the ledger.
*/
void TestDeployTimeoutRestoresPreviousRelease() {
  auto options            = ContainerOptions();
  options.timeouts.deploy = 200ms;
  Fixture f(options);
  f.orchestrator->Start();

  const auto first = f.AwaitTerminal(f.TriggerMain("r1").id);
  assert(first.stage == PipelineStage::kSucceeded);
  assert(f.containers->Running() == "woocommerce-repo:r1");

  f.containers->SlowRollout("woocommerce-repo:abc123", 600ms);
  const auto done = f.AwaitTerminal(f.TriggerMain("abc123").id);
  assert(done.stage == PipelineStage::kFailed);
  assert(done.failure->stage == PipelineStage::kDeploy);
  assert(done.failure->kind == "timeout");
  assert(done.failure->message.find("restored woocommerce-repo:r1") != std::string::npos);

  assert(f.containers->Running() == "woocommerce-repo:r1");
  const auto requests = f.containers->Requests();
  assert(requests.size() == 3);
  assert(requests[1].images[0].image_uri == "woocommerce-repo:abc123");
  assert((requests[2].images == std::vector<ImageDefinition>{ImageDefinition{"WooCommerceContainer", "woocommerce-repo:r1"}}));
  assert(requests[2].service == "WooCommerceService");

  const auto releases = f.orchestrator->Releases();
  assert(releases.size() == 1);
  assert(releases[0].revision == "r1");
  assert(releases[0].execution_id == first.id);
}

void TestDeployTimeoutWithoutEarlierRelease() {
  auto options            = ContainerOptions();
  options.timeouts.deploy = 100ms;
  Fixture f(options);
  f.containers->SlowRollout("woocommerce-repo:abc123", 400ms);
  f.orchestrator->Start();

  const auto done = f.AwaitTerminal(f.TriggerMain("abc123").id);
  assert(done.failure->kind == "timeout");
  assert(done.failure->message.find("no earlier release") != std::string::npos);
  assert(f.containers->Requests().size() == 1);
  assert(f.orchestrator->Releases().empty());
}

void TestStopInterruptsActiveExecution() {
  Gate    install;
  Fixture f;
  f.toolchain->gates[BuildPhase::kInstall] = &install;
  f.orchestrator->Start();

  const auto execution = f.TriggerMain("abc123");
  assert(install.WaitEntered(kWait));
  f.orchestrator->Stop();

  const auto stopped = f.orchestrator->Get(execution.id);
  assert(stopped.stage == PipelineStage::kFailed);
  assert(stopped.failure->stage == PipelineStage::kBuild);
  assert(stopped.failure->kind == "interrupted");
  assert(f.functions->targets.empty());
}

void TestSourceAndBuildFailures() {
  {
    Fixture f;
    f.source->fail = true;
    f.orchestrator->Start();

    const auto done = f.AwaitTerminal(f.TriggerMain("abc123").id);
    assert(done.failure->stage == PipelineStage::kSource);
    assert(done.failure->kind == "source_error");
    assert(done.failure->message.find("repository unreachable") != std::string::npos);
  }
  {
    Fixture f;
    f.toolchain->fail_phase = BuildPhase::kTagImage;
    f.orchestrator->Start();

    const auto done = f.AwaitTerminal(f.TriggerMain("abc123").id);
    assert(done.failure->stage == PipelineStage::kBuild);
    assert(done.failure->phase == "tag_image");
    assert(done.failure->kind == "build_error");
    assert(done.source_artifact == "workspace/abc123");
    assert(f.functions->targets.empty());
  }
}

void TestPartialDeploymentIsFlagged() {
  Fixture f;
  f.functions->outcomes = {FunctionOutcome{"products", true, ""}, FunctionOutcome{"orders", false, "throttled"}};
  f.orchestrator->Start();

  const auto done = f.AwaitTerminal(f.TriggerMain("abc123").id);
  assert(done.stage == PipelineStage::kFailed);
  assert(done.partial_deployment);
  assert(done.failure->stage == PipelineStage::kDeploy);
  assert(done.failure->kind == "partial_deployment");
  assert(f.orchestrator->Releases().empty());
}

void TestTriggerValidation() {
  Fixture f;
  f.orchestrator->Start();

  assert(!f.orchestrator->Trigger({"feature/x", "abc123"}).has_value());
  assert(f.orchestrator->List(0).empty());
  assert(Throws<shopstack::util::InvalidState>([&] { f.orchestrator->Trigger({"main", ""}); }));
  assert(Throws<shopstack::util::NotFound>([&] { f.orchestrator->Get("missing"); }));
  assert(Throws<shopstack::util::NotFound>([&] { f.orchestrator->Cancel("missing"); }));
}

void TestStartRecoversPersistedExecutions() {
  auto repository = std::make_shared<shopstack::db::memory::MemoryRepository>();

  ExecutionRecord waiting;
  waiting.id       = "queued-before-restart";
  waiting.pipeline = "WooCommercePipeline";
  waiting.branch   = "main";
  waiting.revision = "rev-queued";

  ExecutionRecord building = waiting;
  building.id              = "building-before-restart";
  building.revision        = "rev-building";
  building.stage           = PipelineStage::kBuild;
  building.queued          = false;

  {
    auto tx = repository->Begin();
    assert(repository->InsertExecution(*tx, building));
    assert(repository->InsertExecution(*tx, waiting));
    tx->Commit();
  }

  Fixture f(Options(), repository);
  f.orchestrator->Start();

  const auto interrupted = f.orchestrator->Get(building.id);
  assert(interrupted.stage == PipelineStage::kFailed);
  assert(interrupted.failure->stage == PipelineStage::kBuild);
  assert(interrupted.failure->kind == "interrupted");

  assert(f.AwaitTerminal(waiting.id).stage == PipelineStage::kSucceeded);
  assert(f.source->Fetched() == std::vector<std::string>{"rev-queued"});
}

} // namespace

int main() {
  TestHappyPathRecordsRelease();
  TestTriggerDuringBuildQueuesBehindActive();
  TestCancelQueuedExecution();
  TestCancelDuringBuild();
  TestCancelDuringDeployIsRejected();
  TestStageTimeout();
  TestDeployTimeoutRestoresPreviousRelease();
  TestDeployTimeoutWithoutEarlierRelease();
  TestStopInterruptsActiveExecution();
  TestSourceAndBuildFailures();
  TestPartialDeploymentIsFlagged();
  TestTriggerValidation();
  TestStartRecoversPersistedExecutions();

  std::cout << "shopstack_unit_pipeline_orchestrator: pass\n";
  return 0;
}
