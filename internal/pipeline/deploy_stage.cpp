#include "deploy_stage.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shopstack::pipeline {

using observability::IntField;
using observability::StringField;

namespace {

std::string Join(const std::vector<std::string>& values) {
  std::string out;
  for (const auto& value : values) {
    if (!out.empty()) out += ",";
    out += value;
  }
  return out;
}

} // namespace

DeployStage::DeployStage(std::shared_ptr<FunctionDeployer> functions, std::shared_ptr<ContainerOrchestrator> containers, DeployStageOptions options)
    : functions_(std::move(functions)), containers_(std::move(containers)), options_(std::move(options)) {
}

DeployOutcome DeployStage::Run(const std::string& revision, const std::string& build_artifact, const CancellationToken& token) const {
  ThrowIfCancelled(token, "deploy");
  if (options_.mode == DeployMode::kContainer) {
    return RunContainer(build_artifact, token);
  }
  return RunFunctions(revision, build_artifact, token);
}

DeployOutcome DeployStage::RunFunctions(const std::string& revision, const std::string& build_artifact, const CancellationToken& token) const {
  if (!functions_) {
    throw util::PipelineStageError("Deploy", "invoke", "no function deployer configured");
  }

  std::vector<FunctionOutcome> outcomes;
  try {
    outcomes = functions_->Invoke(options_.target, options_.function_identities, build_artifact, token);
  } catch (const OperationCancelled&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PipelineStageError("Deploy", "invoke", "invoking '" + options_.target + "' failed: " + e.what());
  }

  std::vector<std::string> succeeded;
  std::vector<std::string> failed;
  std::string              first_error;
  for (const auto& outcome : outcomes) {
    if (outcome.ok) {
      succeeded.push_back(outcome.function);
    } else {
      failed.push_back(outcome.function);
      if (first_error.empty()) first_error = outcome.message;
    }
  }

  if (!failed.empty() && !succeeded.empty()) {
    SHOPSTACK_LOG_ERROR("partial deployment: functions run mixed revisions",
                        {StringField("target", options_.target), StringField("revision", revision), StringField("deployed", Join(succeeded)),
                         StringField("failed", Join(failed)), IntField("failed_count", static_cast<std::int64_t>(failed.size()))});
    throw PartialDeploymentError("revision " + revision + " deployed to " + Join(succeeded) + " but not to " + Join(failed) + ": " + first_error,
                                 failed);
  }
  if (!failed.empty()) {
    throw util::PipelineStageError("Deploy", "invoke", "deployment of " + Join(failed) + " failed: " + first_error);
  }

  return DeployOutcome{build_artifact};
}

DeployOutcome DeployStage::RunContainer(const std::string& build_artifact, const CancellationToken& token) const {
  if (!containers_) {
    throw util::PipelineStageError("Deploy", "rolling_update", "no container orchestrator configured");
  }

  // DescriptorError propagates unchanged.
  auto images = ImageDefinitions::ParseAndValidate(build_artifact, options_.task_count);
  if (images.empty()) {
    throw util::DescriptorError("image definitions are empty");
  }

  RollingUpdateRequest request{options_.cluster, options_.service, images};
  try {
    containers_->RollingUpdate(request, token);
  } catch (const OperationCancelled&) {
    throw;
  } catch (const std::exception& e) {
    throw util::PipelineStageError("Deploy", "rolling_update", "rolling update of '" + options_.service + "' failed: " + e.what());
  }

  return DeployOutcome{images.front().image_uri};
}

void DeployStage::Restore(const std::string& previous_artifact, const CancellationToken& token) const {
  if (options_.mode == DeployMode::kContainer) {
    if (!containers_) {
      throw util::PipelineStageError("Deploy", "restore", "no container orchestrator configured");
    }
    RollingUpdateRequest request{options_.cluster, options_.service, {ImageDefinition{options_.container_name, previous_artifact}}};
    try {
      containers_->RollingUpdate(request, token);
    } catch (const std::exception& e) {
      throw util::PipelineStageError("Deploy", "restore", "rolling '" + options_.service + "' back to " + previous_artifact + " failed: " + e.what());
    }
    return;
  }

  if (!functions_) {
    throw util::PipelineStageError("Deploy", "restore", "no function deployer configured");
  }
  std::vector<FunctionOutcome> outcomes;
  try {
    outcomes = functions_->Invoke(options_.target, options_.function_identities, previous_artifact, token);
  } catch (const std::exception& e) {
    throw util::PipelineStageError("Deploy", "restore", "re-invoking '" + options_.target + "' with " + previous_artifact + " failed: " + e.what());
  }
  std::vector<std::string> failed;
  for (const auto& outcome : outcomes) {
    if (!outcome.ok) failed.push_back(outcome.function);
  }
  if (!failed.empty()) {
    throw util::PipelineStageError("Deploy", "restore", "restoring " + previous_artifact + " failed for " + Join(failed));
  }
}

} // namespace shopstack::pipeline
