#include "shell_collaborators.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace shopstack::pipeline::shell {

using observability::IntField;
using observability::StringField;

namespace {

std::vector<std::string> ToVector(const google::protobuf::RepeatedPtrField<std::string>& field) {
  return {field.begin(), field.end()};
}

std::string ParametersJson(const std::map<std::string, std::string>& parameters) {
  google::protobuf::Struct payload;
  auto&                    fields = *payload.mutable_fields();
  for (const auto& [key, value] : parameters) {
    fields[key].set_string_value(value);
  }

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(payload, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode deploy parameters: " + std::string(status.message()));
  }
  return json;
}

} // namespace

// ------------------------------------------------------------
// Source
// ------------------------------------------------------------

ShellSourceProvider::ShellSourceProvider(runtime::config::SourceRepositoryConfig repository, std::string workspace_dir,
                                         std::vector<std::string> commands)
    : repository_(std::move(repository)), workspace_dir_(std::move(workspace_dir)), commands_(std::move(commands)) {
}

std::string ShellSourceProvider::Fetch(const SourceChange& change, const CancellationToken& token) {
  const Environment env = {
      {"SOURCE_OWNER", repository_.owner()},
      {"SOURCE_REPO", repository_.repo()},
      {"SOURCE_BRANCH", change.branch},
      {"RESOLVED_SOURCE_VERSION", change.revision},
      {"WORKSPACE_DIR", workspace_dir_},
  };

  SHOPSTACK_LOG_INFO("fetching source", {StringField("repo", repository_.owner() + "/" + repository_.repo()),
                                         StringField("revision", change.revision)});
  RunAll(commands_, env, token);
  return workspace_dir_;
}

// ------------------------------------------------------------
// Build
// ------------------------------------------------------------

ShellBuildToolchain::ShellBuildToolchain(const runtime::config::PipelineCommandsConfig& commands)
    : install_(ToVector(commands.install())),
      registry_login_(ToVector(commands.registry_login())),
      build_image_(ToVector(commands.build_image())),
      tag_image_(ToVector(commands.tag_image())),
      push_images_(ToVector(commands.push_images())) {
}

const std::vector<std::string>& ShellBuildToolchain::CommandsFor(BuildPhase phase) const {
  switch (phase) {
    case BuildPhase::kInstall:
      return install_;
    case BuildPhase::kRegistryLogin:
      return registry_login_;
    case BuildPhase::kBuildImage:
      return build_image_;
    case BuildPhase::kTagImage:
      return tag_image_;
    case BuildPhase::kPushImages:
      return push_images_;
    case BuildPhase::kWriteDescriptor:
      // written by the build stage itself
      return none_;
  }
  return none_;
}

void ShellBuildToolchain::RunPhase(BuildPhase phase, const BuildEnvironment& env, const std::string& source_artifact,
                                   const CancellationToken& token) {
  const auto& commands = CommandsFor(phase);
  if (commands.empty()) return;

  // Commands run from the checked-out tree.
  std::vector<std::string> scoped;
  scoped.reserve(commands.size());
  for (const auto& command : commands) {
    scoped.push_back("cd \"$SOURCE_DIR\" && " + command);
  }

  Environment phase_env(env.begin(), env.end());
  phase_env["SOURCE_DIR"] = source_artifact;
  RunAll(scoped, phase_env, token);
}

// ------------------------------------------------------------
// Function deploy
// ------------------------------------------------------------

ShellFunctionDeployer::ShellFunctionDeployer(std::vector<std::string> commands) : commands_(std::move(commands)) {
}

std::vector<FunctionOutcome> ShellFunctionDeployer::Invoke(const std::string& target, const std::map<std::string, std::string>& parameters,
                                                           const std::string& artifact, const CancellationToken& token) {
  const Environment env = {
      {"DEPLOY_TARGET", target},
      {"DEPLOY_PARAMETERS", ParametersJson(parameters)},
      {"ARTIFACT_DIR", artifact},
  };

  SHOPSTACK_LOG_INFO("invoking deploy target", {StringField("target", target), IntField("functions", static_cast<std::int64_t>(parameters.size()))});
  return ParseOutcomes(RunAll(commands_, env, token));
}

std::vector<FunctionOutcome> ShellFunctionDeployer::ParseOutcomes(const std::string& output) {
  std::vector<std::string> lines;
  std::istringstream       in(output);
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    if (it->find("\"outcomes\"") == std::string::npos) continue;

    google::protobuf::Struct document;
    if (!google::protobuf::util::JsonStringToMessage(*it, &document, options).ok()) continue;

    const auto found = document.fields().find("outcomes");
    if (found == document.fields().end() || !found->second.has_list_value()) continue;

    std::vector<FunctionOutcome> outcomes;
    for (const auto& entry : found->second.list_value().values()) {
      if (!entry.has_struct_value()) continue;
      const auto&     fields = entry.struct_value().fields();
      FunctionOutcome outcome;
      if (auto f = fields.find("function"); f != fields.end()) outcome.function = f->second.string_value();
      if (auto f = fields.find("ok"); f != fields.end()) outcome.ok = f->second.bool_value();
      if (auto f = fields.find("message"); f != fields.end()) outcome.message = f->second.string_value();
      outcomes.push_back(std::move(outcome));
    }
    return outcomes;
  }
  return {};
}

// ------------------------------------------------------------
// Container deploy
// ------------------------------------------------------------

ShellContainerOrchestrator::ShellContainerOrchestrator(std::vector<std::string> commands) : commands_(std::move(commands)) {
}

void ShellContainerOrchestrator::RollingUpdate(const RollingUpdateRequest& request, const CancellationToken& token) {
  if (request.images.empty()) {
    throw std::invalid_argument("rolling update without images");
  }

  const Environment env = {
      {"CLUSTER_NAME", request.cluster},
      {"SERVICE_NAME", request.service},
      {"CONTAINER_NAME", request.images.front().name},
      {"IMAGE_URI", request.images.front().image_uri},
  };

  SHOPSTACK_LOG_INFO("starting rolling update", {StringField("cluster", request.cluster), StringField("service", request.service),
                                                 StringField("image", request.images.front().image_uri)});
  RunAll(commands_, env, token);
}

} // namespace shopstack::pipeline::shell
