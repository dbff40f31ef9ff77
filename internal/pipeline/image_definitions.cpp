#include "image_definitions.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace shopstack::pipeline {

using google::protobuf::ListValue;
using google::protobuf::Value;
using util::DescriptorError;

namespace {

std::string RequireString(const google::protobuf::Struct& entry, const char* key, size_t index) {
  auto it = entry.fields().find(key);
  if (it == entry.fields().end() || it->second.kind_case() != Value::kStringValue || it->second.string_value().empty()) {
    throw DescriptorError("image definition " + std::to_string(index) + " is missing '" + key + "'");
  }
  return it->second.string_value();
}

} // namespace

std::string ImageDefinitions::Serialize(const std::vector<ImageDefinition>& definitions) {
  ListValue list;
  for (const auto& definition : definitions) {
    auto& fields = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["name"].set_string_value(definition.name);
    fields["imageUri"].set_string_value(definition.image_uri);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw DescriptorError("failed to serialize image definitions: " + std::string(status.message()));
  }
  return json;
}

std::vector<ImageDefinition> ImageDefinitions::Parse(const std::string& json) {
  ListValue list;
  auto      status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!status.ok()) {
    throw DescriptorError("malformed image definitions: " + std::string(status.message()));
  }

  std::vector<ImageDefinition> out;
  out.reserve(static_cast<size_t>(list.values_size()));
  for (int i = 0; i < list.values_size(); ++i) {
    const auto& value = list.values(i);
    const auto  index = static_cast<size_t>(i);
    if (value.kind_case() != Value::kStructValue) {
      throw DescriptorError("image definition " + std::to_string(index) + " is not an object");
    }
    out.push_back(ImageDefinition{RequireString(value.struct_value(), "name", index), RequireString(value.struct_value(), "imageUri", index)});
  }
  return out;
}

std::vector<ImageDefinition> ImageDefinitions::ParseAndValidate(const std::string& json, size_t expected_entries) {
  auto definitions = Parse(json);
  if (definitions.size() != expected_entries) {
    throw DescriptorError("image definitions list " + std::to_string(definitions.size()) + " entries, expected " +
                          std::to_string(expected_entries));
  }
  return definitions;
}

} // namespace shopstack::pipeline
