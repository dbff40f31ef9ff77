#include "build_stage.hpp"

#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shopstack::pipeline {

using observability::StringField;

std::string_view ToString(BuildPhase phase) {
  switch (phase) {
    case BuildPhase::kInstall:
      return "install";
    case BuildPhase::kRegistryLogin:
      return "registry_login";
    case BuildPhase::kBuildImage:
      return "build_image";
    case BuildPhase::kTagImage:
      return "tag_image";
    case BuildPhase::kPushImages:
      return "push_images";
    case BuildPhase::kWriteDescriptor:
      return "write_descriptor";
  }
  return "unknown";
}

BuildStage::BuildStage(std::shared_ptr<BuildToolchain> toolchain, BuildStageOptions options)
    : toolchain_(std::move(toolchain)), options_(std::move(options)) {
}

BuildEnvironment BuildStage::Environment(const std::string& revision) const {
  return {
      {"REPOSITORY_URI", options_.repository_uri},
      {"RESOLVED_SOURCE_VERSION", revision},
      {"AWS_DEFAULT_REGION", options_.region},
  };
}

BuildOutput BuildStage::Run(const std::string& revision, const std::string& source_artifact, const CancellationToken& token,
                            const PhaseObserver& on_phase) const {
  std::vector<BuildPhase> phases = {BuildPhase::kInstall, BuildPhase::kRegistryLogin, BuildPhase::kBuildImage, BuildPhase::kTagImage,
                                    BuildPhase::kPushImages};
  if (options_.container_name) {
    phases.push_back(BuildPhase::kWriteDescriptor);
  }

  const auto  env       = Environment(revision);
  const auto  image_uri = options_.repository_uri + ":" + revision;
  BuildOutput output;
  output.image_uri = image_uri;
  // The function topology ships the whole source tree.
  output.artifact = source_artifact;

  for (auto phase : phases) {
    const std::string name(ToString(phase));
    ThrowIfCancelled(token, "phase " + name);
    if (on_phase) on_phase(phase);

    try {
      if (phase == BuildPhase::kWriteDescriptor) {
        output.artifact = ImageDefinitions::Serialize({ImageDefinition{*options_.container_name, image_uri}});
        continue;
      }

      const auto& phase_token = phase == BuildPhase::kPushImages ? CancellationToken::Never() : token;
      toolchain_->RunPhase(phase, env, source_artifact, phase_token);
    } catch (const OperationCancelled&) {
      throw;
    } catch (const std::exception& e) {
      SHOPSTACK_LOG_ERROR("build phase failed", {StringField("phase", name), StringField("revision", revision), StringField("error", e.what())});
      throw util::PipelineStageError("Build", name, "phase " + name + " failed: " + e.what());
    }
  }

  return output;
}

} // namespace shopstack::pipeline
