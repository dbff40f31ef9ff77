#pragma once

#include <string>
#include <vector>

namespace shopstack::pipeline {

/*
  Deployment descriptor of the container topology:

    [{"name":"<container>","imageUri":"<repository>:<revision>"}]
*/
struct ImageDefinition {
  std::string name;
  std::string image_uri;

  bool operator==(const ImageDefinition&) const = default;
};

class ImageDefinitions {
 public:
  static std::string Serialize(const std::vector<ImageDefinition>& definitions);

  // Throws util::DescriptorError on malformed JSON or missing fields.
  static std::vector<ImageDefinition> Parse(const std::string& json);

  // Parse plus exactly `expected_entries` entries.
  static std::vector<ImageDefinition> ParseAndValidate(const std::string& json, size_t expected_entries);
};

} // namespace shopstack::pipeline
