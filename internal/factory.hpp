#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/pipeline/pipeline_orchestrator.hpp"
#include "internal/service/pipeline_service.hpp"
#include "internal/service/topology_service.hpp"
#include "internal/topology/topology_builder.hpp"

namespace shopstack::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process. The orchestrator
  is null for the variant without a delivery pipeline.
*/
struct Application {
  std::shared_ptr<const topology::Topology>       topology;
  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<pipeline::PipelineOrchestrator> orchestrator;

  std::shared_ptr<service::PipelineService> pipeline_service;
  std::shared_ptr<service::TopologyService> topology_service;
};

/*
  Build

  Constructs the entire backend based on runtime config. Throws
  ConstructionError when the topology is invalid.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and collaborator types.
*/
Application Build(const shopstack::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const shopstack::runtime::config::RuntimeConfig& config);

// Pipeline options resolved from the config and the topology's deploy surface.
pipeline::PipelineOptions BuildPipelineOptions(const shopstack::runtime::config::RuntimeConfig& config, const topology::Topology& composed);

// Shell-backed collaborators from the configured command lists.
pipeline::Collaborators BuildShellCollaborators(const shopstack::runtime::config::PipelineConfig& config);

} // namespace shopstack::factory
