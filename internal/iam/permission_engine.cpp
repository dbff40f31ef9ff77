#include "permission_engine.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace shopstack::iam {

using graph::NodeKind;
using graph::Relation;

namespace {

std::vector<std::string> Sorted(std::vector<std::string> actions) {
  std::sort(actions.begin(), actions.end());
  return actions;
}

} // namespace

const std::vector<std::string>& PermissionEngine::TableActions() {
  static const std::vector<std::string> kActions = Sorted(
      {"get", "put", "update", "delete", "query", "scan", "batch-get", "batch-write", "condition-check", "describe"});
  return kActions;
}

const std::vector<std::string>& PermissionEngine::RegistryActions() {
  static const std::vector<std::string> kActions = Sorted({"pull", "push", "complete-layer-upload", "get-download-url", "batch-get-image"});
  return kActions;
}

std::string PermissionEngine::PrincipalFor(const graph::ResourceNode& node) {
  return "role/" + node.name;
}

std::string PermissionEngine::ResourceIdFor(const graph::ResourceNode& node) {
  return node.Attribute(graph::attr::kResourceId).value_or(node.name);
}

std::vector<GrantStatement> PermissionEngine::Derive(const graph::ResourceGraph& graph) {
  std::vector<GrantStatement> grants;

  for (const auto& edge : graph.Edges()) {
    if (!graph.Contains(edge.from) || !graph.Contains(edge.to)) {
      throw util::GrantDerivationError("edge " + std::string(graph::ToString(edge.relation)) + " has no endpoint in the graph");
    }
    const auto& from = graph.Node(edge.from);
    const auto& to   = graph.Node(edge.to);

    if (edge.relation == Relation::kReadsWrites) {
      if (to.kind != NodeKind::kTable) {
        throw util::GrantDerivationError("reads_writes edge from '" + from.name + "' does not target a table");
      }
      grants.push_back(GrantStatement{PrincipalFor(from), TableActions(), ResourceIdFor(to)});
      continue;
    }

    if (edge.relation == Relation::kTriggers && from.kind == NodeKind::kBuildProject && to.kind == NodeKind::kImageRepository) {
      grants.push_back(GrantStatement{PrincipalFor(from), RegistryActions(), ResourceIdFor(to)});
      grants.push_back(GrantStatement{PrincipalFor(from), {"get-authorization-token"}, kWildcardResource});
    }
  }

  std::sort(grants.begin(), grants.end());
  grants.erase(std::unique(grants.begin(), grants.end()), grants.end());
  return grants;
}

} // namespace shopstack::iam
