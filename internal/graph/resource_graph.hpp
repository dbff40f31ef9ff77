#pragma once

#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "resource_node.hpp"

namespace shopstack::graph {

/*
  Resource graph.

  Owns every node and edge of one topology. Edges form a DAG and are only
  ever added explicitly; nothing is inferred from attributes.

  Construction failures (duplicate name, unknown endpoint, cycle, relation
  not allowed between the two kinds) throw a ConstructionError subtype and
  leave the graph unchanged.

  Not thread-safe: the graph is built once, then only read.
*/
class ResourceGraph {
 public:
  NodeId AddNode(NodeKind kind, const std::string& name, Attributes attributes = {});

  void AddEdge(NodeId from, NodeId to, Relation relation);

  // Dependencies before dependents; ties broken by insertion order.
  std::vector<NodeId> TopologicalOrder() const;

  // Outgoing edges of `node` with `relation`.
  std::set<NodeId> Neighbors(NodeId node, Relation relation) const;

  // Incoming edges of `node` with `relation`.
  std::set<NodeId> Dependents(NodeId node, Relation relation) const;

  const ResourceNode& Node(NodeId id) const;
  const ResourceNode* Find(const std::string& name) const;
  std::vector<NodeId> NodesOfKind(NodeKind kind) const;

  const std::vector<Edge>& Edges() const {
    return edges_;
  }
  size_t NodeCount() const {
    return nodes_.size();
  }
  bool Contains(NodeId id) const {
    return id < nodes_.size();
  }

 private:
  bool Reaches(NodeId start, NodeId target) const;

  std::vector<ResourceNode>               nodes_;
  std::unordered_map<std::string, NodeId> by_name_;
  std::vector<Edge>                       edges_;
  std::vector<std::vector<NodeId>>        outgoing_;
};

/*
  Environment of a compute unit, derived from its reads_writes edges:
  <TABLE NAME UPPERCASE>_TABLE -> table resource id, plus any explicit
  "env." attributes on the node.
*/
std::map<std::string, std::string> DeriveEnvironment(const ResourceGraph& graph, NodeId unit);

} // namespace shopstack::graph
