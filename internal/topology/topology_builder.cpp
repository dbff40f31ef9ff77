#include "topology_builder.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace shopstack::topology {

using namespace shopstack::runtime::config;
using graph::Attributes;
using graph::NodeId;
using graph::NodeKind;
using graph::Relation;
namespace attr = graph::attr;

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Capitalize(std::string value) {
  if (!value.empty()) value[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(value[0])));
  return value;
}

Variant FromProto(TopologyVariant variant) {
  switch (variant) {
    case TOPOLOGY_VARIANT_GATEWAY_FUNCTION:
      return Variant::kGatewayFunction;
    case TOPOLOGY_VARIANT_CONTAINER_SERVICE_PIPELINE:
      return Variant::kContainerServicePipeline;
    case TOPOLOGY_VARIANT_GATEWAY_FUNCTION_PIPELINE:
    default:
      return Variant::kGatewayFunctionPipeline;
  }
}

const char* AccessPatternName(AccessPattern pattern) {
  return pattern == ACCESS_PATTERN_READ_MOSTLY ? graph::kReadMostly : graph::kStateful;
}

/*
  Shared construction state for one build.
*/
class Assembler {
 public:
  Assembler(Topology& topology, const TopologyConfig& config) : topology_(topology), config_(config) {
    stack_ = config.stack_name().empty() ? "Shopstack" : config.stack_name();
    region_ = config.region().empty() ? "us-east-1" : config.region();
  }

  NodeId AddBucket() {
    const auto name = stack_ + "Assets";
    return Graph().AddNode(NodeKind::kStorageBucket, name,
                           {{attr::kResourceId, "arn:aws:s3:::" + Lower(name)},
                            {attr::kDomainName, Lower(name) + ".s3." + region_ + ".amazonaws.com"},
                            {"website_index_document", "index.html"}});
  }

  std::vector<NodeId> AddTables() {
    std::vector<NodeId> tables;
    for (const auto& resource : config_.resources()) {
      const auto name = Capitalize(resource.name()) + "Table";
      tables.push_back(Graph().AddNode(NodeKind::kTable, name,
                                       {{attr::kLogicalName, resource.name()},
                                        {attr::kPartitionKeyName, resource.partition_key()},
                                        {attr::kPartitionKeyType, "STRING"},
                                        {attr::kResourceId, "arn:aws:dynamodb:" + region_ + ":table/" + name}}));
    }
    return tables;
  }

  NodeId AddDistribution() {
    return Graph().AddNode(NodeKind::kDistribution, "Distribution", {{attr::kDomainName, Lower(stack_) + ".cloudfront.net"}});
  }

  std::vector<NodeId> AddFunctions(const std::vector<NodeId>& tables) {
    std::vector<NodeId> units;
    const auto runtime = config_.function_runtime().empty() ? std::string("nodejs16.x") : config_.function_runtime();
    for (int i = 0; i < config_.resources_size(); ++i) {
      const auto& resource = config_.resources(i);
      const auto  unit     = Graph().AddNode(NodeKind::kComputeUnit, resource.name(),
                                             {{attr::kLogicalName, resource.name()},
                                              {attr::kFlavor, graph::kFlavorFunction},
                                              {attr::kAccessPattern, AccessPatternName(resource.access_pattern())},
                                              {attr::kRuntime, runtime},
                                              {attr::kHandler, "index.handler"},
                                              {attr::kCodePath, "lambda/" + resource.name()},
                                              {attr::kResourceId, "arn:aws:lambda:" + region_ + ":function:" + Capitalize(resource.name()) + "Function"}});
      Graph().AddEdge(unit, tables[static_cast<size_t>(i)], Relation::kReadsWrites);
      units.push_back(unit);
    }
    return units;
  }

  NodeId AddGateway(const std::vector<NodeId>& units) {
    const auto name    = stack_ + "Api";
    const auto domain  = Lower(name) + ".execute-api." + region_ + ".amazonaws.com";
    const auto gateway = Graph().AddNode(NodeKind::kGateway, name,
                                         {{attr::kDomainName, domain}, {attr::kUrl, "https://" + domain + "/prod/"}, {"rest_api_name", "Woo-Commerce API"}});
    for (auto unit : units) {
      Graph().AddEdge(gateway, unit, Relation::kServesTrafficTo);
    }
    return gateway;
  }

  void AddFunctionOutputs(NodeId distribution, NodeId gateway) {
    topology_.outputs.push_back(
        {"CloudFrontURL", "https://" + Graph().Node(distribution).Attribute(attr::kDomainName).value_or(""), "CloudFront URL"});
    topology_.outputs.push_back({"APIGatewayURL", Graph().Node(gateway).Attribute(attr::kUrl).value_or(""), "API Gateway URL"});
  }

  NodeId AddImageRepository(const PipelineConfig& pipeline) {
    const auto name = stack_ + "Repo";
    const auto uri  = pipeline.image_repository_uri().empty() ? Lower(stack_) + "-repo" : pipeline.image_repository_uri();
    return Graph().AddNode(NodeKind::kImageRepository, name,
                           {{attr::kRepositoryUri, uri}, {attr::kResourceId, "arn:aws:ecr:" + region_ + ":repository/" + Lower(name)}});
  }

  // Source repository, build project and pipeline; returns the pipeline node.
  NodeId AddPipeline(const PipelineConfig& pipeline, NodeId image_repository, NodeId deploy_target) {
    const auto& repository = pipeline.repository();
    const auto  source     = Graph().AddNode(NodeKind::kRepository, "SourceRepository",
                                             {{"owner", repository.owner()}, {"repo", repository.repo()}, {attr::kBranch, repository.branch()}});
    const auto  build      = Graph().AddNode(NodeKind::kBuildProject, "BuildProject", {{"build_image", "standard-5.0"}, {"privileged", "true"}});
    const auto  name       = pipeline.name().empty() ? stack_ + "Pipeline" : pipeline.name();
    const auto  node       = Graph().AddNode(NodeKind::kPipeline, name, {{attr::kBranch, repository.branch()}});

    Graph().AddEdge(node, source, Relation::kDependsOn);
    Graph().AddEdge(node, build, Relation::kTriggers);
    Graph().AddEdge(build, image_repository, Relation::kTriggers);
    Graph().AddEdge(node, deploy_target, Relation::kDeploysTo);
    return node;
  }

  graph::ResourceGraph& Graph() {
    return topology_.graph;
  }
  const std::string& Region() const {
    return region_;
  }
  const std::string& Stack() const {
    return stack_;
  }

 private:
  Topology&             topology_;
  const TopologyConfig& config_;
  std::string           stack_;
  std::string           region_;
};

void BuildFunctionTopology(Topology& topology, const TopologyConfig& config, const PipelineConfig& pipeline, bool with_pipeline) {
  Assembler a(topology, config);

  const auto bucket       = a.AddBucket();
  const auto tables       = a.AddTables();
  const auto image_repo   = with_pipeline ? std::optional<NodeId>(a.AddImageRepository(pipeline)) : std::nullopt;
  const auto units        = a.AddFunctions(tables);
  const auto gateway      = a.AddGateway(units);
  const auto distribution = a.AddDistribution();
  a.Graph().AddEdge(distribution, bucket, Relation::kServesTrafficTo);
  a.Graph().AddEdge(distribution, gateway, Relation::kServesTrafficTo);
  a.AddFunctionOutputs(distribution, gateway);

  if (!with_pipeline) return;

  if (units.empty()) {
    throw util::ConstructionError("pipeline topology requires at least one compute unit");
  }

  // The original stack invoked the first function for deployment.
  const auto* target = pipeline.deploy_target().empty() ? &a.Graph().Node(units.front()) : a.Graph().Find(pipeline.deploy_target());
  if (target == nullptr || target->kind != NodeKind::kComputeUnit) {
    throw util::DanglingReferenceError("pipeline deploy target '" + pipeline.deploy_target() + "' is not a compute unit");
  }
  a.AddPipeline(pipeline, *image_repo, target->id);

  DeploySurface surface;
  surface.deploy_target  = target->name;
  surface.region         = a.Region();
  surface.repository_uri = a.Graph().Node(*image_repo).Attribute(attr::kRepositoryUri).value_or("");
  for (auto unit : units) {
    const auto& node = a.Graph().Node(unit);
    surface.function_identities[node.name + "FunctionArn"] = node.Attribute(attr::kResourceId).value_or(node.name);
  }
  topology.deploy = std::move(surface);
}

void BuildContainerTopology(Topology& topology, const TopologyConfig& config, const PipelineConfig& pipeline) {
  Assembler   a(topology, config);
  const auto& container = config.container();

  const auto bucket     = a.AddBucket();
  const auto tables     = a.AddTables();
  const auto image_repo = a.AddImageRepository(pipeline);

  const auto service_name   = a.Stack() + "Service";
  const auto cluster_name   = a.Stack() + "Cluster";
  const auto container_name = container.name().empty() ? a.Stack() + "Container" : container.name();

  const auto service = a.Graph().AddNode(NodeKind::kContainerService, service_name,
                                         {{attr::kFlavor, graph::kFlavorContainerTask},
                                          {attr::kAccessPattern, graph::kStateful},
                                          {"cluster", cluster_name},
                                          {"container_name", container_name},
                                          {"container_port", std::to_string(container.port())},
                                          {"cpu", std::to_string(container.cpu())},
                                          {"memory_mib", std::to_string(container.memory_mib())},
                                          {"desired_count", std::to_string(container.desired_count())},
                                          {"max_azs", std::to_string(container.max_azs())},
                                          {"log_stream_prefix", a.Stack()},
                                          {attr::kLoadBalancerDns, Lower(service_name) + "-alb." + a.Region() + ".elb.amazonaws.com"}});
  for (auto table : tables) {
    a.Graph().AddEdge(service, table, Relation::kReadsWrites);
  }
  a.Graph().AddEdge(service, image_repo, Relation::kDependsOn);

  const auto distribution = a.AddDistribution();
  a.Graph().AddEdge(distribution, bucket, Relation::kServesTrafficTo);
  a.Graph().AddEdge(distribution, service, Relation::kServesTrafficTo);

  const auto& dist_node = a.Graph().Node(distribution);
  const auto& svc_node  = a.Graph().Node(service);
  topology.outputs.push_back({"CloudFrontURL", "https://" + dist_node.Attribute(attr::kDomainName).value_or(""), "CloudFront URL"});
  topology.outputs.push_back({"LoadBalancerURL", svc_node.Attribute(attr::kLoadBalancerDns).value_or(""), "Load Balancer URL"});

  a.AddPipeline(pipeline, image_repo, service);

  DeploySurface surface;
  surface.deploy_target  = service_name;
  surface.region         = a.Region();
  surface.repository_uri = a.Graph().Node(image_repo).Attribute(attr::kRepositoryUri).value_or("");
  surface.container_name = container_name;
  surface.cluster_name   = cluster_name;
  surface.service_name   = service_name;
  // One container definition per task.
  surface.task_count = 1;
  topology.deploy    = std::move(surface);
}

} // namespace

std::string TopologyBuilder::ToString(Variant variant) {
  switch (variant) {
    case Variant::kGatewayFunction:
      return "gateway_function";
    case Variant::kGatewayFunctionPipeline:
      return "gateway_function_pipeline";
    case Variant::kContainerServicePipeline:
      return "container_service_pipeline";
  }
  return "unknown";
}

Topology TopologyBuilder::Build(const TopologyConfig& config, const PipelineConfig& pipeline) {
  Topology topology;
  topology.variant = FromProto(config.variant());

  switch (topology.variant) {
    case Variant::kGatewayFunction:
      BuildFunctionTopology(topology, config, pipeline, false);
      break;
    case Variant::kGatewayFunctionPipeline:
      BuildFunctionTopology(topology, config, pipeline, true);
      break;
    case Variant::kContainerServicePipeline:
      BuildContainerTopology(topology, config, pipeline);
      break;
  }

  return topology;
}

} // namespace shopstack::topology
