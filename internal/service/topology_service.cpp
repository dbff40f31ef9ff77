#include "topology_service.hpp"

#include "internal/iam/permission_engine.hpp"
#include "internal/routing/rule_engine.hpp"
#include "internal/topology/topology_builder.hpp"
#include "internal/util/errors.hpp"
#include "rpc_observer.hpp"

namespace shopstack::service {

using namespace shopstack::api::v1;
using shopstack::graph::NodeKind;

TopologyService::TopologyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.topology) {
    throw shopstack::util::InvalidState("topology service requires a topology");
  }
  description_ = Assemble(*ctx_.topology);
}

DescribeTopologyResponse TopologyService::Assemble(const shopstack::topology::Topology& topology) {
  const auto& graph = topology.graph;

  DescribeTopologyResponse resp;
  resp.set_variant(shopstack::topology::TopologyBuilder::ToString(topology.variant));

  for (auto id : graph.TopologicalOrder()) {
    const auto& node = graph.Node(id);
    auto*       out  = resp.add_nodes();
    out->set_id(node.id);
    out->set_kind(std::string(shopstack::graph::ToString(node.kind)));
    out->set_name(node.name);
    auto& attributes = *out->mutable_attributes();
    for (const auto& [key, value] : node.attributes) {
      attributes[key] = value;
    }
    if (node.kind == NodeKind::kComputeUnit || node.kind == NodeKind::kContainerService) {
      for (const auto& [key, value] : shopstack::graph::DeriveEnvironment(graph, id)) {
        attributes["env." + key] = value;
      }
    }
  }

  for (const auto& edge : graph.Edges()) {
    auto* out = resp.add_edges();
    out->set_from(graph.Node(edge.from).name);
    out->set_to(graph.Node(edge.to).name);
    out->set_relation(std::string(shopstack::graph::ToString(edge.relation)));
  }

  for (const auto& grant : shopstack::iam::PermissionEngine::Derive(graph)) {
    auto* out = resp.add_grants();
    out->set_principal(grant.principal);
    for (const auto& action : grant.actions) {
      out->add_actions(action);
    }
    out->set_resource(grant.resource);
  }

  for (const auto& rule : shopstack::routing::RuleEngine::BuildRules(graph)) {
    auto* out = resp.add_routing_rules();
    out->set_path_pattern(rule.path_pattern);
    out->set_origin(rule.origin);
    out->set_origin_kind(std::string(shopstack::routing::ToString(rule.origin_kind)));
    out->set_cache_policy(std::string(shopstack::routing::ToString(rule.cache_policy)));
    out->set_protocol_policy(std::string(shopstack::routing::ToString(rule.protocol_policy)));
    out->set_allowed_methods(std::string(shopstack::routing::ToString(rule.allowed_methods)));
  }

  for (const auto& route : shopstack::routing::RuleEngine::BuildGatewayRoutes(graph)) {
    auto* out = resp.add_gateway_routes();
    out->set_gateway(route.gateway);
    out->set_resource_path(route.resource_path);
    for (const auto& method : route.methods) {
      out->add_methods(method);
    }
    out->set_integration(route.integration);
  }

  for (const auto& output : topology.outputs) {
    auto* out = resp.add_outputs();
    out->set_key(output.key);
    out->set_value(output.value);
    out->set_description(output.description);
  }

  return resp;
}

DescribeTopologyResponse TopologyService::Describe(const DescribeTopologyRequest&) {
  return ObserveRpc("TopologyService.Describe", "", [&] { return description_; });
}

} // namespace shopstack::service
