#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

namespace shopstack::config {

using namespace shopstack::runtime::config;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // Quoted scalars stay strings ("0042" is a revision, not a number).
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

static void AddResource(TopologyConfig* topology, const std::string& name, const std::string& key, AccessPattern pattern) {
  auto* resource = topology->add_resources();
  resource->set_name(name);
  resource->set_partition_key(key);
  resource->set_access_pattern(pattern);
}

template <typename Field>
static void DefaultCommands(Field* field, std::initializer_list<const char*> commands) {
  if (field->empty()) {
    for (const char* command : commands) {
      field->Add(command);
    }
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = ParseYaml(yaml);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseYaml(yaml);
  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50061");
  }
  if (!config.database().has_memory() && !config.database().has_sqlite()) {
    config.mutable_database()->mutable_memory();
  }

  auto* topology = config.mutable_topology();
  if (topology->variant() == TOPOLOGY_VARIANT_UNSPECIFIED) {
    topology->set_variant(TOPOLOGY_VARIANT_GATEWAY_FUNCTION_PIPELINE);
  }
  if (topology->stack_name().empty()) {
    topology->set_stack_name("WooCommerce");
  }
  if (topology->region().empty()) {
    const char* region = std::getenv("AWS_DEFAULT_REGION");
    topology->set_region(region ? region : "us-east-1");
  }
  if (topology->function_runtime().empty()) {
    topology->set_function_runtime("nodejs16.x");
  }
  if (topology->resources().empty()) {
    AddResource(topology, "products", "productId", ACCESS_PATTERN_READ_MOSTLY);
    AddResource(topology, "orders", "orderId", ACCESS_PATTERN_STATEFUL);
    AddResource(topology, "cart", "cartId", ACCESS_PATTERN_STATEFUL);
  }

  auto* container = topology->mutable_container();
  if (container->name().empty()) container->set_name("WooCommerceContainer");
  if (container->port() == 0) container->set_port(80);
  if (container->cpu() == 0) container->set_cpu(256);
  if (container->memory_mib() == 0) container->set_memory_mib(512);
  if (container->desired_count() == 0) container->set_desired_count(1);
  if (container->max_azs() == 0) container->set_max_azs(2);

  auto* pipeline = config.mutable_pipeline();
  if (pipeline->name().empty()) {
    pipeline->set_name("WooCommercePipeline");
  }
  if (pipeline->repository().branch().empty()) {
    pipeline->mutable_repository()->set_branch("main");
  }
  if (pipeline->history_limit() == 0) {
    pipeline->set_history_limit(50);
  }

  auto* timeouts = pipeline->mutable_timeouts();
  if (timeouts->source_ms() == 0) timeouts->set_source_ms(5ull * 60 * 1000);
  if (timeouts->build_ms() == 0) timeouts->set_build_ms(60ull * 60 * 1000);
  if (timeouts->deploy_ms() == 0) timeouts->set_deploy_ms(30ull * 60 * 1000);

  auto* commands = pipeline->mutable_commands();
  if (commands->workspace_dir().empty()) {
    commands->set_workspace_dir("/var/lib/shopstack/workspace");
  }
  DefaultCommands(commands->mutable_source(),
                  {"test -d \"$WORKSPACE_DIR/.git\" || git clone \"https://github.com/$SOURCE_OWNER/$SOURCE_REPO.git\" \"$WORKSPACE_DIR\"",
                   "git -C \"$WORKSPACE_DIR\" fetch origin \"$SOURCE_BRANCH\"",
                   "git -C \"$WORKSPACE_DIR\" checkout --detach \"$RESOLVED_SOURCE_VERSION\""});
  DefaultCommands(commands->mutable_install(), {"npm install"});
  DefaultCommands(commands->mutable_registry_login(),
                  {"aws ecr get-login-password --region $AWS_DEFAULT_REGION | docker login --username AWS --password-stdin $REPOSITORY_URI"});
  DefaultCommands(commands->mutable_build_image(), {"docker build -t $REPOSITORY_URI:latest ."});
  DefaultCommands(commands->mutable_tag_image(), {"docker tag $REPOSITORY_URI:latest $REPOSITORY_URI:$RESOLVED_SOURCE_VERSION"});
  DefaultCommands(commands->mutable_push_images(),
                  {"docker push $REPOSITORY_URI:latest", "docker push $REPOSITORY_URI:$RESOLVED_SOURCE_VERSION"});
  DefaultCommands(commands->mutable_function_deploy(),
                  {"aws lambda invoke --function-name \"$DEPLOY_TARGET\" --cli-binary-format raw-in-base64-out "
                   "--payload \"$DEPLOY_PARAMETERS\" /dev/stdout"});
  // Registers a task definition revision whose $CONTAINER_NAME runs $IMAGE_URI,
  // then points the service at that revision.
  DefaultCommands(commands->mutable_container_deploy(),
                  {"CURRENT_TASK_DEFINITION=$(aws ecs describe-services --cluster \"$CLUSTER_NAME\" --services \"$SERVICE_NAME\" "
                   "--query 'services[0].taskDefinition' --output text) && "
                   "TASK_DEFINITION_FILE=$(mktemp) && "
                   "aws ecs describe-task-definition --task-definition \"$CURRENT_TASK_DEFINITION\" --query taskDefinition --output json "
                   "| jq --arg name \"$CONTAINER_NAME\" --arg image \"$IMAGE_URI\" "
                   "'(.containerDefinitions[] | select(.name == $name) | .image) = $image "
                   "| del(.taskDefinitionArn, .revision, .status, .requiresAttributes, .compatibilities, .registeredAt, .registeredBy)' "
                   "> \"$TASK_DEFINITION_FILE\" && "
                   "NEW_TASK_DEFINITION=$(aws ecs register-task-definition --cli-input-json \"file://$TASK_DEFINITION_FILE\" "
                   "--query taskDefinition.taskDefinitionArn --output text) && "
                   "rm -f \"$TASK_DEFINITION_FILE\" && "
                   "aws ecs update-service --cluster \"$CLUSTER_NAME\" --service \"$SERVICE_NAME\" --task-definition \"$NEW_TASK_DEFINITION\"",
                   "aws ecs wait services-stable --cluster \"$CLUSTER_NAME\" --services \"$SERVICE_NAME\""});
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  std::unordered_set<std::string> names;
  for (const auto& resource : config.topology().resources()) {
    if (resource.name().empty()) {
      throw std::runtime_error("Invalid configuration: topology resource without a name");
    }
    if (resource.partition_key().empty()) {
      throw std::runtime_error("Invalid configuration: resource '" + resource.name() + "' has no partition_key");
    }
    if (!names.insert(resource.name()).second) {
      throw std::runtime_error("Invalid configuration: duplicate resource '" + resource.name() + "'");
    }
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }

  const auto& deploy_target = config.pipeline().deploy_target();
  if (!deploy_target.empty() && config.topology().variant() == TOPOLOGY_VARIANT_GATEWAY_FUNCTION_PIPELINE &&
      names.find(deploy_target) == names.end()) {
    throw std::runtime_error("Invalid configuration: pipeline.deploy_target '" + deploy_target + "' is not a topology resource");
  }
}

} // namespace shopstack::config
