#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"

namespace shopstack::db::model {

struct StageFailureRecord {
  shopstack::model::PipelineStage stage = shopstack::model::PipelineStage::kSource;
  std::string                     phase;
  std::string                     message;
  // source_error | build_error | deploy_error | descriptor_error |
  // partial_deployment | cancelled | timeout | interrupted
  std::string kind;

  bool operator==(const StageFailureRecord&) const = default;
};

/*
  Persistent pipeline execution.

  Written on every stage transition. Terminal once stage is Succeeded or
  Failed; `queued` is true until the worker picks the execution up.
*/
struct ExecutionRecord {
  std::string id;
  std::string pipeline;
  std::string branch;
  std::string revision;

  shopstack::model::PipelineStage stage  = shopstack::model::PipelineStage::kSource;
  bool                            queued = true;

  std::string source_artifact;
  std::string build_artifact;

  std::optional<StageFailureRecord> failure;
  bool                              partial_deployment = false;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;

  bool operator==(const ExecutionRecord&) const = default;
};

} // namespace shopstack::db::model
