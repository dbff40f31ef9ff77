#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/pipeline_server.hpp"
#include "internal/grpc/topology_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

using shopstack::factory::Build;
using shopstack::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  shopstack::observability::ShutdownLogging();
  shopstack::observability::ShutdownMetrics();
  shopstack::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: shopstack-server <config.yaml> OR shopstack-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = shopstack::config::ConfigLoader::LoadFromYaml(config_path);

    shopstack::observability::InitializeTracing(config);
    shopstack::observability::InitializeMetrics(config);
    shopstack::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (topology, pipeline, services)
    // ------------------------------------------------------------
    auto app = Build(config);

    std::vector<std::unique_ptr<grpc::Service>> services;
    services.push_back(std::make_unique<shopstack::grpc::TopologyServer>(app.topology_service));
    services.push_back(std::make_unique<shopstack::grpc::PipelineServer>(app.pipeline_service));

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SHOPSTACK_LOG_INFO("shopstack started", {shopstack::observability::StringField("bind_address", config.server().bind_address()),
                                             shopstack::observability::StringField("stack", config.topology().stack_name())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SHOPSTACK_LOG_INFO("shutting down shopstack");

    server.Stop();
    if (app.orchestrator) {
      app.orchestrator->Stop();
    }
    ShutdownObservability();
  } catch (const shopstack::util::ConstructionError& e) {
    SHOPSTACK_LOG_ERROR("invalid topology", {shopstack::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  } catch (const std::exception& e) {
    SHOPSTACK_LOG_ERROR("Fatal error", {shopstack::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
