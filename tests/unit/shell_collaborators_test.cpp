#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/pipeline/image_definitions.hpp"
#include "internal/pipeline/shell/shell_collaborators.hpp"
#include "internal/pipeline/shell/shell_runner.hpp"

namespace {

using namespace std::chrono_literals;
using shopstack::pipeline::BuildPhase;
using shopstack::pipeline::CancellationToken;
using shopstack::pipeline::CancelReason;
using shopstack::pipeline::OperationCancelled;
namespace shell = shopstack::pipeline::shell;

void TestRunCapturesOutputAndExitCode() {
  const auto ok = shell::Run("echo hello; echo oops 1>&2", {}, CancellationToken());
  assert(ok.exit_code == 0);
  assert(ok.output.find("hello") != std::string::npos);
  assert(ok.output.find("oops") != std::string::npos);

  const auto failed = shell::Run("exit 3", {}, CancellationToken());
  assert(failed.exit_code == 3);
}

void TestRunExportsEnvironment() {
  const auto result = shell::Run("printf '%s' \"$RESOLVED_SOURCE_VERSION\"", {{"RESOLVED_SOURCE_VERSION", "abc123"}}, CancellationToken());
  assert(result.output == "abc123");
}

void TestRunAllStopsAtFirstFailure() {
  bool failed = false;
  try {
    shell::RunAll({"echo one", "false", "echo three"}, {}, CancellationToken());
  } catch (const std::runtime_error& e) {
    failed = true;
    assert(std::string(e.what()).find("'false'") != std::string::npos);
  }
  assert(failed);
  assert(shell::RunAll({"echo a", "echo b"}, {}, CancellationToken()) == "a\nb\n");
}

void TestRaisedTokenTerminatesCommand() {
  CancellationToken token;
  const auto        started = std::chrono::steady_clock::now();
  auto              running = std::async(std::launch::async, [&] { return shell::Run("sleep 30", {}, token); });

  std::this_thread::sleep_for(200ms);
  token.Cancel(CancelReason::kCancelled);

  bool cancelled = false;
  try {
    running.get();
  } catch (const OperationCancelled& e) {
    cancelled = true;
    assert(e.reason() == CancelReason::kCancelled);
  }
  assert(cancelled);
  assert(std::chrono::steady_clock::now() - started < 10s);
}

void TestParseOutcomesUsesLastOutcomeLine() {
  const std::string output =
      "StatusCode: 200\n"
      "{\"outcomes\":[{\"function\":\"stale\",\"ok\":false}]}\n"
      "{\"outcomes\":[{\"function\":\"products\",\"ok\":true},{\"function\":\"orders\",\"ok\":false,\"message\":\"throttled\"}]}\n"
      "done\n";

  const auto outcomes = shell::ShellFunctionDeployer::ParseOutcomes(output);
  assert(outcomes.size() == 2);
  assert(outcomes[0].function == "products");
  assert(outcomes[0].ok);
  assert(outcomes[1].function == "orders");
  assert(!outcomes[1].ok);
  assert(outcomes[1].message == "throttled");

  assert(shell::ShellFunctionDeployer::ParseOutcomes("StatusCode: 200\n").empty());
  assert(shell::ShellFunctionDeployer::ParseOutcomes("{\"outcomes\": not json\n").empty());
}

void TestFunctionDeployerPassesParameters() {
  shell::ShellFunctionDeployer deployer({"printf '{\"outcomes\":[{\"function\":\"%s\",\"ok\":true}]}\\n' \"$DEPLOY_TARGET\"",
                                         "printf '%s' \"$DEPLOY_PARAMETERS\" | grep -q productsFunctionArn"});

  const auto outcomes = deployer.Invoke("products", {{"productsFunctionArn", "arn:products"}}, "workspace", CancellationToken());
  assert(outcomes.size() == 1);
  assert(outcomes[0].function == "products");
  assert(outcomes[0].ok);
}

void TestBuildToolchainRunsPhaseCommands() {
  shopstack::runtime::config::PipelineCommandsConfig commands;
  commands.add_install("test \"$(pwd)\" = \"$SOURCE_DIR\"");
  commands.add_tag_image("test \"$RESOLVED_SOURCE_VERSION\" = abc123");
  commands.add_push_images("exit 1");

  shell::ShellBuildToolchain toolchain(commands);
  const shopstack::pipeline::BuildEnvironment env = {{"RESOLVED_SOURCE_VERSION", "abc123"}};

  toolchain.RunPhase(BuildPhase::kInstall, env, "/", CancellationToken());
  toolchain.RunPhase(BuildPhase::kTagImage, env, "/", CancellationToken());
  // no commands configured
  toolchain.RunPhase(BuildPhase::kBuildImage, env, "/", CancellationToken());

  bool failed = false;
  try {
    toolchain.RunPhase(BuildPhase::kPushImages, env, "/", CancellationToken());
  } catch (const std::runtime_error&) {
    failed = true;
  }
  assert(failed);
}

void TestContainerOrchestratorExportsImage() {
  shell::ShellContainerOrchestrator orchestrator(
      {"test \"$IMAGE_URI\" = woocommerce-repo:abc123 && test \"$SERVICE_NAME\" = WooCommerceService"});
  orchestrator.RollingUpdate({"WooCommerceCluster", "WooCommerceService", {{"WooCommerceContainer", "woocommerce-repo:abc123"}}},
                             CancellationToken());

  bool rejected = false;
  try {
    orchestrator.RollingUpdate({"WooCommerceCluster", "WooCommerceService", {}}, CancellationToken());
  } catch (const std::invalid_argument&) {
    rejected = true;
  }
  assert(rejected);
}

void WriteExecutable(const std::filesystem::path& path, const std::string& body) {
  std::ofstream out(path);
  out << body;
  out.close();
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);
}

/*
  Runs the default container deploy commands against stand-in aws and jq
  executables and checks that the service is moved to a task definition
  revision carrying the descriptor image.
*/
void TestDefaultContainerDeployAppliesDescriptorImage() {
  const auto dir = std::filesystem::temp_directory_path() / "shopstack_container_deploy_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const auto log = dir / "aws.log";

  WriteExecutable(dir / "aws", R"SH(#!/bin/sh
echo "aws $*" >> "$AWS_LOG"
case "$2" in
  describe-services) echo "arn:aws:ecs:task-definition/woocommerce:7" ;;
  describe-task-definition) echo '{"family":"woocommerce"}' ;;
  register-task-definition)
    for arg in "$@"; do
      case "$arg" in file://*) cat "${arg#file://}" >> "$AWS_LOG" ;; esac
    done
    echo "arn:aws:ecs:task-definition/woocommerce:8" ;;
esac
)SH");
  WriteExecutable(dir / "jq", R"SH(#!/bin/sh
cat > /dev/null
printf '{"name":"%s","image":"%s"}\n' "$3" "$6"
)SH");

  const std::string path = std::getenv("PATH") ? std::getenv("PATH") : "/usr/bin:/bin";
  ::setenv("PATH", (dir.string() + ":" + path).c_str(), 1);
  ::setenv("AWS_LOG", log.string().c_str(), 1);

  const auto config   = shopstack::config::ConfigLoader::LoadFromYamlString("");
  const auto commands = config.pipeline().commands().container_deploy();
  shell::ShellContainerOrchestrator orchestrator(std::vector<std::string>(commands.begin(), commands.end()));
  orchestrator.RollingUpdate({"WooCommerceCluster", "WooCommerceService", {{"WooCommerceContainer", "woocommerce-repo:abc123"}}},
                             CancellationToken());

  std::ifstream     in(log);
  std::stringstream calls;
  calls << in.rdbuf();
  const auto text = calls.str();

  assert(text.find("aws ecs describe-task-definition --task-definition arn:aws:ecs:task-definition/woocommerce:7") != std::string::npos);
  assert(text.find(R"({"name":"WooCommerceContainer","image":"woocommerce-repo:abc123"})") != std::string::npos);
  assert(text.find("aws ecs update-service --cluster WooCommerceCluster --service WooCommerceService "
                   "--task-definition arn:aws:ecs:task-definition/woocommerce:8") != std::string::npos);
  assert(text.find("aws ecs wait services-stable") != std::string::npos);
  assert(text.find("--force-new-deployment") == std::string::npos);

  ::setenv("PATH", path.c_str(), 1);
  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestRunCapturesOutputAndExitCode();
  TestRunExportsEnvironment();
  TestRunAllStopsAtFirstFailure();
  TestRaisedTokenTerminatesCommand();
  TestParseOutcomesUsesLastOutcomeLine();
  TestFunctionDeployerPassesParameters();
  TestBuildToolchainRunsPhaseCommands();
  TestContainerOrchestratorExportsImage();
  TestDefaultContainerDeployAppliesDescriptorImage();

  std::cout << "shopstack_unit_shell_collaborators: pass\n";
  return 0;
}
