#include "resource_graph.hpp"

#include <algorithm>
#include <cctype>
#include <functional>
#include <queue>

#include "internal/util/errors.hpp"

namespace shopstack::graph {

using shopstack::util::ConstructionError;
using shopstack::util::CycleError;
using shopstack::util::DanglingReferenceError;
using shopstack::util::DuplicateNodeError;

std::string_view ToString(NodeKind kind) {
  switch (kind) {
    case NodeKind::kStorageBucket:
      return "StorageBucket";
    case NodeKind::kTable:
      return "Table";
    case NodeKind::kComputeUnit:
      return "ComputeUnit";
    case NodeKind::kContainerService:
      return "ContainerService";
    case NodeKind::kGateway:
      return "Gateway";
    case NodeKind::kDistribution:
      return "Distribution";
    case NodeKind::kRepository:
      return "Repository";
    case NodeKind::kImageRepository:
      return "ImageRepository";
    case NodeKind::kBuildProject:
      return "BuildProject";
    case NodeKind::kPipeline:
      return "Pipeline";
  }
  return "Unknown";
}

std::string_view ToString(Relation relation) {
  switch (relation) {
    case Relation::kDependsOn:
      return "depends_on";
    case Relation::kReadsWrites:
      return "reads_writes";
    case Relation::kServesTrafficTo:
      return "serves_traffic_to";
    case Relation::kTriggers:
      return "triggers";
    case Relation::kDeploysTo:
      return "deploys_to";
  }
  return "unknown";
}

bool IsPermitted(Relation relation, NodeKind from, NodeKind to) {
  switch (relation) {
    case Relation::kDependsOn:
      return true;
    case Relation::kReadsWrites:
      return (from == NodeKind::kComputeUnit || from == NodeKind::kContainerService) && to == NodeKind::kTable;
    case Relation::kServesTrafficTo:
      return (from == NodeKind::kDistribution || from == NodeKind::kGateway) &&
             (to == NodeKind::kStorageBucket || to == NodeKind::kGateway || to == NodeKind::kComputeUnit || to == NodeKind::kContainerService);
    case Relation::kTriggers:
      return (from == NodeKind::kPipeline || from == NodeKind::kBuildProject) &&
             (to == NodeKind::kBuildProject || to == NodeKind::kImageRepository);
    case Relation::kDeploysTo:
      return from == NodeKind::kPipeline && (to == NodeKind::kComputeUnit || to == NodeKind::kContainerService);
  }
  return false;
}

static std::string Describe(const ResourceNode& from, const ResourceNode& to, Relation relation) {
  return "'" + from.name + "' --" + std::string(ToString(relation)) + "--> '" + to.name + "'";
}

NodeId ResourceGraph::AddNode(NodeKind kind, const std::string& name, Attributes attributes) {
  if (name.empty()) {
    throw ConstructionError("resource node of kind " + std::string(ToString(kind)) + " has no name");
  }
  if (by_name_.contains(name)) {
    throw DuplicateNodeError("duplicate resource node '" + name + "'");
  }

  const auto id = static_cast<NodeId>(nodes_.size());
  nodes_.push_back(ResourceNode{id, kind, name, std::move(attributes)});
  outgoing_.emplace_back();
  by_name_.emplace(name, id);
  return id;
}

void ResourceGraph::AddEdge(NodeId from, NodeId to, Relation relation) {
  if (!Contains(from) || !Contains(to)) {
    const auto missing = !Contains(from) ? from : to;
    throw DanglingReferenceError("edge " + std::string(ToString(relation)) + " references unknown node id " + std::to_string(missing));
  }

  const auto& from_node = nodes_[from];
  const auto& to_node   = nodes_[to];

  if (!IsPermitted(relation, from_node.kind, to_node.kind)) {
    throw ConstructionError("relation not permitted: " + Describe(from_node, to_node, relation) + " (" + std::string(ToString(from_node.kind)) +
                            " -> " + std::string(ToString(to_node.kind)) + ")");
  }

  const Edge edge{from, to, relation};
  if (std::find(edges_.begin(), edges_.end(), edge) != edges_.end()) {
    throw ConstructionError("duplicate edge " + Describe(from_node, to_node, relation));
  }

  // from == to, or an existing path to -> ... -> from, closes a cycle.
  if (from == to || Reaches(to, from)) {
    throw CycleError("edge would create a cycle: " + Describe(from_node, to_node, relation));
  }

  edges_.push_back(edge);
  outgoing_[from].push_back(to);
}

bool ResourceGraph::Reaches(NodeId start, NodeId target) const {
  std::vector<bool>   visited(nodes_.size(), false);
  std::vector<NodeId> stack{start};
  while (!stack.empty()) {
    const auto current = stack.back();
    stack.pop_back();
    if (current == target) return true;
    if (visited[current]) continue;
    visited[current] = true;
    for (auto next : outgoing_[current]) {
      if (!visited[next]) stack.push_back(next);
    }
  }
  return false;
}

std::vector<NodeId> ResourceGraph::TopologicalOrder() const {
  // pending[n] = number of unresolved dependencies of n
  std::vector<size_t>              pending(nodes_.size(), 0);
  std::vector<std::vector<NodeId>> dependents(nodes_.size());
  for (const auto& edge : edges_) {
    ++pending[edge.from];
    dependents[edge.to].push_back(edge.from);
  }

  // Node ids follow insertion order, so a min-heap gives deterministic ties.
  std::priority_queue<NodeId, std::vector<NodeId>, std::greater<>> ready;
  for (NodeId id = 0; id < nodes_.size(); ++id) {
    if (pending[id] == 0) ready.push(id);
  }

  std::vector<NodeId> order;
  order.reserve(nodes_.size());
  while (!ready.empty()) {
    const auto id = ready.top();
    ready.pop();
    order.push_back(id);
    for (auto dependent : dependents[id]) {
      if (--pending[dependent] == 0) ready.push(dependent);
    }
  }

  return order;
}

std::set<NodeId> ResourceGraph::Neighbors(NodeId node, Relation relation) const {
  std::set<NodeId> out;
  for (const auto& edge : edges_) {
    if (edge.from == node && edge.relation == relation) out.insert(edge.to);
  }
  return out;
}

std::set<NodeId> ResourceGraph::Dependents(NodeId node, Relation relation) const {
  std::set<NodeId> out;
  for (const auto& edge : edges_) {
    if (edge.to == node && edge.relation == relation) out.insert(edge.from);
  }
  return out;
}

const ResourceNode& ResourceGraph::Node(NodeId id) const {
  if (!Contains(id)) {
    throw DanglingReferenceError("unknown node id " + std::to_string(id));
  }
  return nodes_[id];
}

const ResourceNode* ResourceGraph::Find(const std::string& name) const {
  auto it = by_name_.find(name);
  if (it == by_name_.end()) return nullptr;
  return &nodes_[it->second];
}

std::vector<NodeId> ResourceGraph::NodesOfKind(NodeKind kind) const {
  std::vector<NodeId> out;
  for (const auto& node : nodes_) {
    if (node.kind == kind) out.push_back(node.id);
  }
  return out;
}

std::map<std::string, std::string> DeriveEnvironment(const ResourceGraph& graph, NodeId unit) {
  std::map<std::string, std::string> env;

  const auto& node       = graph.Node(unit);
  const auto  prefix_len = std::string(attr::kEnvPrefix).size();
  for (const auto& [key, value] : node.attributes) {
    if (key.rfind(attr::kEnvPrefix, 0) == 0) {
      env[key.substr(prefix_len)] = value;
    }
  }

  for (auto table_id : graph.Neighbors(unit, Relation::kReadsWrites)) {
    const auto& table = graph.Node(table_id);
    auto        key   = table.Attribute(attr::kLogicalName).value_or(table.name);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::isalnum(c) ? std::toupper(c) : '_'; });
    env[key + "_TABLE"] = table.Attribute(attr::kResourceId).value_or(table.name);
  }

  return env;
}

} // namespace shopstack::graph
