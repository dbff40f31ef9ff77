#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/graph/resource_graph.hpp"

namespace shopstack::topology {

enum class Variant {
  kGatewayFunction,
  kGatewayFunctionPipeline,
  kContainerServicePipeline,
};

struct StackOutput {
  std::string key;
  std::string value;
  std::string description;
};

/*
  Everything the pipeline needs to know about its deploy target, resolved
  from the graph at build time.
*/
struct DeploySurface {
  std::string deploy_target;
  std::string repository_uri;
  std::string region;

  // function topologies: "<unit>FunctionArn" -> function identity
  std::map<std::string, std::string> function_identities;

  // container topology
  std::string container_name;
  std::string cluster_name;
  std::string service_name;
  size_t      task_count = 0;
};

struct Topology {
  Variant                      variant{Variant::kGatewayFunction};
  graph::ResourceGraph         graph;
  std::vector<StackOutput>     outputs;
  std::optional<DeploySurface> deploy;

  bool HasPipeline() const {
    return deploy.has_value();
  }
};

/*
  Builds one of the three storefront topologies as an explicit graph.

  Every node and edge is declared here; the engines downstream only read the
  result. Throws ConstructionError (or a subtype) on an invalid graph.
*/
class TopologyBuilder {
 public:
  static Topology Build(const shopstack::runtime::config::TopologyConfig& topology,
                        const shopstack::runtime::config::PipelineConfig& pipeline);

  static std::string ToString(Variant variant);
};

} // namespace shopstack::topology
