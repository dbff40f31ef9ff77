#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace shopstack::util {

/*
  Central error types.

  Construction errors are raised while the resource graph is assembled and
  abort provisioning. Service-level errors get translated later to gRPC
  status codes.
*/

class ConstructionError : public std::runtime_error {
 public:
  explicit ConstructionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CycleError : public ConstructionError {
 public:
  explicit CycleError(const std::string& msg) : ConstructionError(msg) {
  }
};

class DanglingReferenceError : public ConstructionError {
 public:
  explicit DanglingReferenceError(const std::string& msg) : ConstructionError(msg) {
  }
};

class DuplicateNodeError : public ConstructionError {
 public:
  explicit DuplicateNodeError(const std::string& msg) : ConstructionError(msg) {
  }
};

// Only reachable if graph construction invariants were bypassed.
class GrantDerivationError : public std::runtime_error {
 public:
  explicit GrantDerivationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RoutingConflictError : public std::runtime_error {
 public:
  explicit RoutingConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PipelineStageError : public std::runtime_error {
 public:
  PipelineStageError(std::string stage, std::string phase, const std::string& msg)
      : std::runtime_error(msg), stage_(std::move(stage)), phase_(std::move(phase)) {
  }

  const std::string& stage() const {
    return stage_;
  }
  const std::string& phase() const {
    return phase_;
  }

 private:
  std::string stage_;
  std::string phase_;
};

class DescriptorError : public std::runtime_error {
 public:
  explicit DescriptorError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace shopstack::util
