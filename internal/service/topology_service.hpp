#pragma once

#include "shopstack/v1.hpp"
#include "service_context.hpp"

namespace shopstack::topology { struct Topology; }

namespace shopstack::service {

/*
  Read-only view of the composed storefront.

  Grants, routing rules and gateway routes are derived once at construction,
  so a topology the engines reject fails startup instead of a request.
*/
class TopologyService {
public:
  explicit TopologyService(ServiceContext ctx);

  shopstack::api::v1::DescribeTopologyResponse
  Describe(const shopstack::api::v1::DescribeTopologyRequest& req);

  static shopstack::api::v1::DescribeTopologyResponse Assemble(const shopstack::topology::Topology& topology);

private:
  ServiceContext                               ctx_;
  shopstack::api::v1::DescribeTopologyResponse description_;
};

}
