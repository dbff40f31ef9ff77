#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace shopstack::graph {

enum class NodeKind : std::uint8_t {
  kStorageBucket = 0,
  kTable,
  kComputeUnit,
  kContainerService,
  kGateway,
  kDistribution,
  kRepository,
  kImageRepository,
  kBuildProject,
  kPipeline,
};

enum class Relation : std::uint8_t {
  kDependsOn = 0,
  kReadsWrites,
  kServesTrafficTo,
  kTriggers,
  kDeploysTo,
};

using NodeId     = std::uint32_t;
using Attributes = std::map<std::string, std::string>;

/*
  A provisioned resource.

  Identity (id, kind, name) is fixed once the node is added to a graph.
*/
struct ResourceNode {
  NodeId      id = 0;
  NodeKind    kind{};
  std::string name;
  Attributes  attributes;

  std::optional<std::string> Attribute(const std::string& key) const {
    auto it = attributes.find(key);
    if (it == attributes.end()) return std::nullopt;
    return it->second;
  }
};

// (from, to) reads "from depends on to": `to` is provisioned first.
struct Edge {
  NodeId   from = 0;
  NodeId   to   = 0;
  Relation relation{};

  bool operator==(const Edge&) const = default;
};

std::string_view ToString(NodeKind kind);
std::string_view ToString(Relation relation);

bool IsPermitted(Relation relation, NodeKind from, NodeKind to);

// Well-known attribute keys.
namespace attr {
inline constexpr const char* kPartitionKeyName = "partition_key_name";
inline constexpr const char* kPartitionKeyType = "partition_key_type";
inline constexpr const char* kFlavor           = "flavor";
inline constexpr const char* kAccessPattern    = "access_pattern";
inline constexpr const char* kRuntime          = "runtime";
inline constexpr const char* kHandler          = "handler";
inline constexpr const char* kCodePath         = "code_path";
inline constexpr const char* kResourceId       = "resource_id";
inline constexpr const char* kLogicalName      = "logical_name";
inline constexpr const char* kDomainName       = "domain_name";
inline constexpr const char* kUrl              = "url";
inline constexpr const char* kLoadBalancerDns  = "load_balancer_dns";
inline constexpr const char* kRepositoryUri    = "repository_uri";
inline constexpr const char* kBranch           = "branch";
inline constexpr const char* kEnvPrefix        = "env.";
} // namespace attr

inline constexpr const char* kFlavorFunction      = "function";
inline constexpr const char* kFlavorContainerTask = "container_task";
inline constexpr const char* kReadMostly          = "read_mostly";
inline constexpr const char* kStateful            = "stateful";

} // namespace shopstack::graph
