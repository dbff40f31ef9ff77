#pragma once

#include <cstdint>
#include <memory>

namespace shopstack::topology { struct Topology; }
namespace shopstack::pipeline { class PipelineOrchestrator; }

namespace shopstack::service {

/*
  Dependency container shared by all services.

  `orchestrator` is null for the variant without a delivery pipeline.
*/
struct ServiceContext {
  std::shared_ptr<const shopstack::topology::Topology>       topology;
  std::shared_ptr<shopstack::pipeline::PipelineOrchestrator> orchestrator;
  uint32_t                                                   history_limit = 50;
};

}
