#pragma once

#include <cstdint>
#include <string_view>

namespace shopstack::model {

enum class PipelineStage : std::uint8_t {
  kSource    = 0,
  kBuild     = 1,
  kDeploy    = 2,
  kSucceeded = 3,
  kFailed    = 4,
};

constexpr bool IsTerminal(PipelineStage stage) {
  return stage == PipelineStage::kSucceeded || stage == PipelineStage::kFailed;
}

// Forward by exactly one step, or to Failed from any non-terminal stage.
constexpr bool CanTransition(PipelineStage from, PipelineStage to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == PipelineStage::kFailed) {
    return true;
  }
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

constexpr std::string_view ToString(PipelineStage stage) {
  switch (stage) {
    case PipelineStage::kSource:
      return "Source";
    case PipelineStage::kBuild:
      return "Build";
    case PipelineStage::kDeploy:
      return "Deploy";
    case PipelineStage::kSucceeded:
      return "Succeeded";
    case PipelineStage::kFailed:
      return "Failed";
  }
  return "Unknown";
}

} // namespace shopstack::model
