#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/graph/resource_graph.hpp"
#include "routing_rule.hpp"

namespace shopstack::routing {

/*
  Derives edge routing and caching behavior from the graph.

    distribution -> bucket              "/*"            RedirectToHttps, Optimized
    distribution -> gateway -> unit     "/api/<unit>/*" HttpsOnly, Optimized only
                                                        for read_mostly units
    distribution -> container service   "/api/*"        HttpsOnly, Disabled

  Candidates sharing a pattern are merged (Disabled wins); the same pattern
  on two different origins throws RoutingConflictError.

  Output order: longest literal prefix first, "/*" last.
*/
class RuleEngine {
 public:
  static std::vector<RoutingRule> BuildRules(const graph::ResourceGraph& graph);

  // First rule whose pattern matches `path`.
  static std::optional<RoutingRule> Match(const std::vector<RoutingRule>& rules, const std::string& path);

  static std::vector<GatewayRoute> BuildGatewayRoutes(const graph::ResourceGraph& graph);

  static bool PatternMatches(const std::string& pattern, const std::string& path);
};

} // namespace shopstack::routing
