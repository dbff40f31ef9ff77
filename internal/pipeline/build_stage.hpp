#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "collaborators.hpp"

namespace shopstack::pipeline {

struct BuildStageOptions {
  std::string repository_uri;
  std::string region;
  // Set for the container topology: enables the write_descriptor phase.
  std::optional<std::string> container_name;
};

struct BuildOutput {
  // Output tree reference (functions) or descriptor JSON (container).
  std::string artifact;
  std::string image_uri;
};

/*
  Build stage: install, registry_login, build_image, tag_image, push_images
  and, for containers, write_descriptor, strictly in that order.

  The token is checked before every phase. push_images receives a token
  that cannot be raised, so a started push always runs to completion.
*/
class BuildStage {
 public:
  using PhaseObserver = std::function<void(BuildPhase)>;

  BuildStage(std::shared_ptr<BuildToolchain> toolchain, BuildStageOptions options);

  BuildEnvironment Environment(const std::string& revision) const;

  // Throws PipelineStageError (phase failure) or OperationCancelled.
  BuildOutput Run(const std::string& revision, const std::string& source_artifact, const CancellationToken& token,
                  const PhaseObserver& on_phase = {}) const;

 private:
  std::shared_ptr<BuildToolchain> toolchain_;
  BuildStageOptions               options_;
};

} // namespace shopstack::pipeline
