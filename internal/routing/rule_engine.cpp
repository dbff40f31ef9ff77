#include "rule_engine.hpp"

#include <algorithm>
#include <map>

#include "internal/util/errors.hpp"

namespace shopstack::routing {

using graph::NodeKind;
using graph::Relation;
using graph::ResourceNode;

std::string_view ToString(OriginKind kind) {
  switch (kind) {
    case OriginKind::kStorageBucket:
      return "storage_bucket";
    case OriginKind::kGateway:
      return "gateway";
    case OriginKind::kLoadBalancer:
      return "load_balancer";
  }
  return "unknown";
}

std::string_view ToString(CachePolicy policy) {
  return policy == CachePolicy::kOptimized ? "Optimized" : "Disabled";
}

std::string_view ToString(ProtocolPolicy policy) {
  return policy == ProtocolPolicy::kRedirectToHttps ? "RedirectToHttps" : "HttpsOnly";
}

std::string_view ToString(AllowedMethods methods) {
  return methods == AllowedMethods::kGetHead ? "GetHead" : "All";
}

namespace {

std::string LiteralPrefix(const std::string& pattern) {
  if (!pattern.empty() && pattern.back() == '*') {
    return pattern.substr(0, pattern.size() - 1);
  }
  return pattern;
}

std::string OriginDomain(const ResourceNode& node) {
  return node.Attribute(graph::attr::kDomainName).value_or(node.name);
}

std::string UnitPath(const ResourceNode& unit) {
  return unit.Attribute(graph::attr::kLogicalName).value_or(unit.name);
}

// Missing access pattern counts as stateful.
bool IsReadMostly(const ResourceNode& unit) {
  return unit.Attribute(graph::attr::kAccessPattern).value_or(graph::kStateful) == graph::kReadMostly;
}

void Merge(std::map<std::string, RoutingRule>& rules, RoutingRule candidate) {
  auto it = rules.find(candidate.path_pattern);
  if (it == rules.end()) {
    rules.emplace(candidate.path_pattern, std::move(candidate));
    return;
  }

  auto& existing = it->second;
  if (existing.origin != candidate.origin || existing.origin_kind != candidate.origin_kind) {
    throw util::RoutingConflictError("pattern '" + candidate.path_pattern + "' routes to both '" + existing.origin + "' and '" +
                                     candidate.origin + "'");
  }
  if (existing.cache_policy != candidate.cache_policy) {
    existing.cache_policy = CachePolicy::kDisabled;
  }
  if (existing.protocol_policy != candidate.protocol_policy) {
    existing.protocol_policy = ProtocolPolicy::kHttpsOnly;
  }
  if (existing.allowed_methods != candidate.allowed_methods) {
    existing.allowed_methods = AllowedMethods::kAll;
  }
}

} // namespace

bool RuleEngine::PatternMatches(const std::string& pattern, const std::string& path) {
  if (pattern.empty()) return false;
  if (pattern.back() != '*') return pattern == path;
  const auto prefix = LiteralPrefix(pattern);
  return path.compare(0, prefix.size(), prefix) == 0;
}

std::vector<RoutingRule> RuleEngine::BuildRules(const graph::ResourceGraph& graph) {
  std::map<std::string, RoutingRule> merged;

  for (auto distribution_id : graph.NodesOfKind(NodeKind::kDistribution)) {
    for (auto origin_id : graph.Neighbors(distribution_id, Relation::kServesTrafficTo)) {
      const auto& origin = graph.Node(origin_id);

      switch (origin.kind) {
        case NodeKind::kStorageBucket:
          Merge(merged, RoutingRule{kDefaultPattern, OriginDomain(origin), OriginKind::kStorageBucket, CachePolicy::kOptimized,
                                    ProtocolPolicy::kRedirectToHttps, AllowedMethods::kGetHead});
          break;

        case NodeKind::kGateway:
          for (auto unit_id : graph.Neighbors(origin_id, Relation::kServesTrafficTo)) {
            const auto& unit = graph.Node(unit_id);
            if (unit.kind != NodeKind::kComputeUnit) continue;
            Merge(merged, RoutingRule{"/api/" + UnitPath(unit) + "/*", OriginDomain(origin), OriginKind::kGateway,
                                      IsReadMostly(unit) ? CachePolicy::kOptimized : CachePolicy::kDisabled, ProtocolPolicy::kHttpsOnly,
                                      AllowedMethods::kAll});
          }
          break;

        case NodeKind::kContainerService:
          Merge(merged, RoutingRule{"/api/*", origin.Attribute(graph::attr::kLoadBalancerDns).value_or(origin.name), OriginKind::kLoadBalancer,
                                    CachePolicy::kDisabled, ProtocolPolicy::kHttpsOnly, AllowedMethods::kAll});
          break;

        default:
          // Direct distribution -> compute unit origins are not modeled.
          break;
      }
    }
  }

  std::vector<RoutingRule> rules;
  rules.reserve(merged.size());
  for (auto& [_, rule] : merged) {
    rules.push_back(std::move(rule));
  }

  std::stable_sort(rules.begin(), rules.end(), [](const RoutingRule& a, const RoutingRule& b) {
    const bool a_default = a.path_pattern == kDefaultPattern;
    const bool b_default = b.path_pattern == kDefaultPattern;
    if (a_default != b_default) return b_default;
    const auto a_len = LiteralPrefix(a.path_pattern).size();
    const auto b_len = LiteralPrefix(b.path_pattern).size();
    if (a_len != b_len) return a_len > b_len;
    return a.path_pattern < b.path_pattern;
  });

  return rules;
}

std::optional<RoutingRule> RuleEngine::Match(const std::vector<RoutingRule>& rules, const std::string& path) {
  for (const auto& rule : rules) {
    if (PatternMatches(rule.path_pattern, path)) return rule;
  }
  return std::nullopt;
}

std::vector<GatewayRoute> RuleEngine::BuildGatewayRoutes(const graph::ResourceGraph& graph) {
  std::vector<GatewayRoute> routes;
  for (auto gateway_id : graph.NodesOfKind(NodeKind::kGateway)) {
    const auto& gateway = graph.Node(gateway_id);
    for (auto unit_id : graph.Neighbors(gateway_id, Relation::kServesTrafficTo)) {
      const auto& unit = graph.Node(unit_id);
      if (unit.kind != NodeKind::kComputeUnit) continue;
      routes.push_back(GatewayRoute{gateway.name, "/" + UnitPath(unit), {"GET", "POST"}, unit.name});
    }
  }
  return routes;
}

} // namespace shopstack::routing
