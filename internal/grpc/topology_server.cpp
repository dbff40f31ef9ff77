#include "topology_server.hpp"
#include "grpc_error.hpp"

namespace shopstack::grpc {

TopologyServer::TopologyServer(std::shared_ptr<shopstack::service::TopologyService> svc)
    : service_(std::move(svc)) {}

::grpc::Status TopologyServer::Describe(::grpc::ServerContext*,
                                        const shopstack::api::v1::DescribeTopologyRequest* req,
                                        shopstack::api::v1::DescribeTopologyResponse* resp) {
  try {
    *resp = service_->Describe(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
