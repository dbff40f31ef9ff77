#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/shell/shell_collaborators.hpp"
#include "internal/service/service_context.hpp"
#if SHOPSTACK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace shopstack::factory {

using observability::IntField;
using observability::StringField;

namespace {

std::vector<std::string> ToVector(const google::protobuf::RepeatedPtrField<std::string>& field) {
  return {field.begin(), field.end()};
}

std::chrono::milliseconds OrDefault(uint64_t value_ms, std::chrono::milliseconds fallback) {
  return value_ms == 0 ? fallback : std::chrono::milliseconds(value_ms);
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const shopstack::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SHOPSTACK_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    SHOPSTACK_LOG_INFO("using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

pipeline::PipelineOptions BuildPipelineOptions(const shopstack::runtime::config::RuntimeConfig& config, const topology::Topology& composed) {
  if (!composed.deploy) {
    throw std::invalid_argument("topology has no delivery pipeline");
  }
  const auto& surface  = *composed.deploy;
  const auto& pipeline_config = config.pipeline();

  pipeline::PipelineOptions options;
  options.name   = pipeline_config.name();
  options.branch = pipeline_config.repository().branch();

  const pipeline::StageTimeouts defaults;
  options.timeouts.source = OrDefault(pipeline_config.timeouts().source_ms(), defaults.source);
  options.timeouts.build  = OrDefault(pipeline_config.timeouts().build_ms(), defaults.build);
  options.timeouts.deploy = OrDefault(pipeline_config.timeouts().deploy_ms(), defaults.deploy);

  options.build.repository_uri = surface.repository_uri;
  options.build.region         = surface.region;
  options.deploy.target        = surface.deploy_target;

  if (composed.variant == topology::Variant::kContainerServicePipeline) {
    options.build.container_name  = surface.container_name;
    options.deploy.mode           = pipeline::DeployMode::kContainer;
    options.deploy.container_name = surface.container_name;
    options.deploy.cluster        = surface.cluster_name;
    options.deploy.service        = surface.service_name;
    options.deploy.task_count     = surface.task_count;
  } else {
    options.deploy.mode                = pipeline::DeployMode::kFunction;
    options.deploy.function_identities = surface.function_identities;
  }
  return options;
}

pipeline::Collaborators BuildShellCollaborators(const shopstack::runtime::config::PipelineConfig& config) {
  const auto& commands = config.commands();

  pipeline::Collaborators collaborators;
  collaborators.source =
      std::make_shared<pipeline::shell::ShellSourceProvider>(config.repository(), commands.workspace_dir(), ToVector(commands.source()));
  collaborators.toolchain  = std::make_shared<pipeline::shell::ShellBuildToolchain>(commands);
  collaborators.functions  = std::make_shared<pipeline::shell::ShellFunctionDeployer>(ToVector(commands.function_deploy()));
  collaborators.containers = std::make_shared<pipeline::shell::ShellContainerOrchestrator>(ToVector(commands.container_deploy()));
  return collaborators;
}

/*
    Build full application dependency graph
*/
Application Build(const shopstack::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Topology (construction errors abort startup)
  // ------------------------------------------------------------------
  auto composed = std::make_shared<topology::Topology>(topology::TopologyBuilder::Build(config.topology(), config.pipeline()));
  app.topology  = composed;

  SHOPSTACK_LOG_INFO("topology composed", {StringField("variant", topology::TopologyBuilder::ToString(composed->variant)),
                                           IntField("nodes", static_cast<std::int64_t>(composed->graph.NodeCount())),
                                           IntField("edges", static_cast<std::int64_t>(composed->graph.Edges().size()))});

  // ------------------------------------------------------------------
  // Delivery pipeline
  // ------------------------------------------------------------------
  if (composed->HasPipeline()) {
    app.repository   = BuildRepository(config);
    app.orchestrator = std::make_shared<pipeline::PipelineOrchestrator>(BuildPipelineOptions(config, *composed),
                                                                        BuildShellCollaborators(config.pipeline()), app.repository);
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.topology      = composed;
  ctx.orchestrator  = app.orchestrator;
  ctx.history_limit = config.pipeline().history_limit() == 0 ? 50 : config.pipeline().history_limit();

  app.topology_service = std::make_shared<service::TopologyService>(ctx);
  app.pipeline_service = std::make_shared<service::PipelineService>(ctx);

  // Started last: recovery re-queues executions left by a previous process.
  if (app.orchestrator) {
    app.orchestrator->Start();
  }

  return app;
}

} // namespace shopstack::factory
