#pragma once

#include <string>
#include <tuple>
#include <vector>

namespace shopstack::iam {

/*
  One allow statement: principal may perform actions on resource.
  Actions are kept sorted so equal statements compare equal.
*/
struct GrantStatement {
  std::string              principal;
  std::vector<std::string> actions;
  std::string              resource;

  bool operator==(const GrantStatement&) const = default;

  bool operator<(const GrantStatement& other) const {
    return std::tie(principal, resource, actions) < std::tie(other.principal, other.resource, other.actions);
  }
};

inline constexpr const char* kWildcardResource = "*";

} // namespace shopstack::iam
