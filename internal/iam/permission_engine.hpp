#pragma once

#include <string>
#include <vector>

#include "grant_statement.hpp"
#include "internal/graph/resource_graph.hpp"

namespace shopstack::iam {

/*
  Derives the minimal grant set from a constructed graph.

    reads_writes (unit -> table)           table data actions on the table only
    triggers (build project -> image repo) registry pull/push on the repo only,
                                           plus get-authorization-token on "*"

  Stateless. The result is sorted and duplicate-free, so deriving twice from
  the same graph yields the same vector.
*/
class PermissionEngine {
 public:
  static std::vector<GrantStatement> Derive(const graph::ResourceGraph& graph);

  static std::string PrincipalFor(const graph::ResourceNode& node);
  static std::string ResourceIdFor(const graph::ResourceNode& node);

  static const std::vector<std::string>& TableActions();
  static const std::vector<std::string>& RegistryActions();
};

} // namespace shopstack::iam
