#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "cancellation.hpp"
#include "image_definitions.hpp"

namespace shopstack::pipeline {

using BuildEnvironment = std::map<std::string, std::string>;

enum class BuildPhase {
  kInstall,
  kRegistryLogin,
  kBuildImage,
  kTagImage,
  kPushImages,
  kWriteDescriptor,
};

std::string_view ToString(BuildPhase phase);

struct SourceChange {
  std::string branch;
  std::string revision;
};

/*
  External collaborators of the pipeline. Implementations throw on failure;
  long-running calls should poll the token and throw OperationCancelled.
*/

class SourceProvider {
 public:
  virtual ~SourceProvider() = default;

  // Returns a reference to the fetched source tree.
  virtual std::string Fetch(const SourceChange& change, const CancellationToken& token) = 0;
};

class BuildToolchain {
 public:
  virtual ~BuildToolchain() = default;

  virtual void RunPhase(BuildPhase phase, const BuildEnvironment& env, const std::string& source_artifact, const CancellationToken& token) = 0;
};

struct FunctionOutcome {
  std::string function;
  bool        ok = false;
  std::string message;
};

class FunctionDeployer {
 public:
  virtual ~FunctionDeployer() = default;

  // Invokes `target` with `parameters`; returns one outcome per function
  // the invocation touched. An empty result means every function succeeded.
  virtual std::vector<FunctionOutcome> Invoke(const std::string&                        target,
                                              const std::map<std::string, std::string>& parameters,
                                              const std::string&                        artifact,
                                              const CancellationToken&                  token) = 0;
};

struct RollingUpdateRequest {
  std::string                  cluster;
  std::string                  service;
  std::vector<ImageDefinition> images;
};

class ContainerOrchestrator {
 public:
  virtual ~ContainerOrchestrator() = default;

  // Atomic, health-checked rolling update. On failure the previous revision
  // must keep running.
  virtual void RollingUpdate(const RollingUpdateRequest& request, const CancellationToken& token) = 0;
};

} // namespace shopstack::pipeline
