#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/pipeline/collaborators.hpp"
#include "shell_runner.hpp"

namespace shopstack::pipeline::shell {

/*
  Collaborators backed by shell command lists from PipelineCommandsConfig.

  Every command runs through /bin/sh with the step's variables exported
  (SOURCE_*, WORKSPACE_DIR, the build environment, DEPLOY_*).
*/

class ShellSourceProvider final : public SourceProvider {
 public:
  ShellSourceProvider(runtime::config::SourceRepositoryConfig repository, std::string workspace_dir, std::vector<std::string> commands);

  // Returns the workspace directory the revision was checked out into.
  std::string Fetch(const SourceChange& change, const CancellationToken& token) override;

 private:
  runtime::config::SourceRepositoryConfig repository_;
  std::string                             workspace_dir_;
  std::vector<std::string>                commands_;
};

class ShellBuildToolchain final : public BuildToolchain {
 public:
  explicit ShellBuildToolchain(const runtime::config::PipelineCommandsConfig& commands);

  void RunPhase(BuildPhase phase, const BuildEnvironment& env, const std::string& source_artifact, const CancellationToken& token) override;

 private:
  const std::vector<std::string>& CommandsFor(BuildPhase phase) const;

  std::vector<std::string> install_;
  std::vector<std::string> registry_login_;
  std::vector<std::string> build_image_;
  std::vector<std::string> tag_image_;
  std::vector<std::string> push_images_;
  std::vector<std::string> none_;
};

/*
  Invokes the deploy target. DEPLOY_PARAMETERS carries the function
  identities as a JSON object.

  Per-function outcomes are read from the last stdout line shaped like
    {"outcomes": [{"function": "...", "ok": true, "message": "..."}]}
  Without one a zero exit means every function succeeded.
*/
class ShellFunctionDeployer final : public FunctionDeployer {
 public:
  explicit ShellFunctionDeployer(std::vector<std::string> commands);

  std::vector<FunctionOutcome> Invoke(const std::string& target, const std::map<std::string, std::string>& parameters,
                                      const std::string& artifact, const CancellationToken& token) override;

  static std::vector<FunctionOutcome> ParseOutcomes(const std::string& output);

 private:
  std::vector<std::string> commands_;
};

class ShellContainerOrchestrator final : public ContainerOrchestrator {
 public:
  explicit ShellContainerOrchestrator(std::vector<std::string> commands);

  void RollingUpdate(const RollingUpdateRequest& request, const CancellationToken& token) override;

 private:
  std::vector<std::string> commands_;
};

} // namespace shopstack::pipeline::shell
