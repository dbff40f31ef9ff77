#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "shopstack/services/v1/shopstack_topology_service.grpc.pb.h"
#include "internal/service/topology_service.hpp"
#include "shopstack/v1.hpp"

namespace shopstack::grpc {

class TopologyServer final : public shopstack::services::v1::ShopstackTopologyService::Service {
public:
  explicit TopologyServer(std::shared_ptr<shopstack::service::TopologyService> svc);

  ::grpc::Status Describe(::grpc::ServerContext*,
                          const shopstack::api::v1::DescribeTopologyRequest*,
                          shopstack::api::v1::DescribeTopologyResponse*) override;

private:
  std::shared_ptr<shopstack::service::TopologyService> service_;
};

}
