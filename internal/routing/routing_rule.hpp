#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shopstack::routing {

enum class OriginKind : std::uint8_t {
  kStorageBucket = 0,
  kGateway,
  kLoadBalancer,
};

enum class CachePolicy : std::uint8_t {
  kOptimized = 0,
  kDisabled,
};

enum class ProtocolPolicy : std::uint8_t {
  kRedirectToHttps = 0,
  kHttpsOnly,
};

enum class AllowedMethods : std::uint8_t {
  kGetHead = 0,
  kAll,
};

/*
  Edge behavior for one path pattern.

  Patterns are either a literal path or a literal prefix followed by '*'.
  "/*" is the default behavior.
*/
struct RoutingRule {
  std::string    path_pattern;
  std::string    origin;
  OriginKind     origin_kind{};
  CachePolicy    cache_policy{CachePolicy::kDisabled};
  ProtocolPolicy protocol_policy{ProtocolPolicy::kHttpsOnly};
  AllowedMethods allowed_methods{AllowedMethods::kAll};

  bool operator==(const RoutingRule&) const = default;
};

// One API resource on a gateway, integrated with a compute unit.
struct GatewayRoute {
  std::string              gateway;
  std::string              resource_path;
  std::vector<std::string> methods;
  std::string              integration;

  bool operator==(const GatewayRoute&) const = default;
};

inline constexpr const char* kDefaultPattern = "/*";

std::string_view ToString(OriginKind kind);
std::string_view ToString(CachePolicy policy);
std::string_view ToString(ProtocolPolicy policy);
std::string_view ToString(AllowedMethods methods);

} // namespace shopstack::routing
