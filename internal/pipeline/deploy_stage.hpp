#pragma once

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "collaborators.hpp"

namespace shopstack::pipeline {

enum class DeployMode {
  kFunction,
  kContainer,
};

struct DeployStageOptions {
  DeployMode  mode = DeployMode::kFunction;
  std::string target;

  // kFunction: "<unit>FunctionArn" -> function identity
  std::map<std::string, std::string> function_identities;

  // kContainer
  std::string container_name;
  std::string cluster;
  std::string service;
  size_t      task_count = 1;
};

struct DeployOutcome {
  // Artifact now running on the target.
  std::string running_artifact;
};

/*
  Deploy stage.

  Functions: one informational invocation of the target naming every
  function identity. Outcomes are per function and not atomic: a mix of
  successes and failures raises PartialDeploymentError.

  Container: the descriptor is parsed and validated before the orchestrator
  is asked for a rolling update.
*/
class DeployStage {
 public:
  DeployStage(std::shared_ptr<FunctionDeployer> functions, std::shared_ptr<ContainerOrchestrator> containers, DeployStageOptions options);

  DeployOutcome Run(const std::string& revision, const std::string& build_artifact, const CancellationToken& token) const;

  // Puts `previous_artifact` (a running artifact recorded by an earlier
  // release) back on the target. Throws PipelineStageError on failure.
  void Restore(const std::string& previous_artifact, const CancellationToken& token) const;

  const DeployStageOptions& options() const {
    return options_;
  }

 private:
  DeployOutcome RunFunctions(const std::string& revision, const std::string& build_artifact, const CancellationToken& token) const;
  DeployOutcome RunContainer(const std::string& build_artifact, const CancellationToken& token) const;

  std::shared_ptr<FunctionDeployer>      functions_;
  std::shared_ptr<ContainerOrchestrator> containers_;
  DeployStageOptions                     options_;
};

// Some functions run the new revision, others do not.
class PartialDeploymentError : public std::runtime_error {
 public:
  PartialDeploymentError(const std::string& msg, std::vector<std::string> failed) : std::runtime_error(msg), failed_(std::move(failed)) {
  }

  const std::vector<std::string>& failed() const {
    return failed_;
  }

 private:
  std::vector<std::string> failed_;
};

} // namespace shopstack::pipeline
