#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/pipeline/collaborators.hpp"

namespace shopstack::testing {

/*
  Blocks stage work until Open() or until the stage token is raised.
*/
class Gate {
 public:
  void Open() {
    {
      std::lock_guard lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  // Waits until open; returns false when the token was raised first.
  bool Wait(const pipeline::CancellationToken& token) {
    {
      std::lock_guard lock(mutex_);
      entered_ = true;
    }
    cv_.notify_all();

    std::unique_lock lock(mutex_);
    while (!open_) {
      if (token.IsCancelled()) return false;
      cv_.wait_for(lock, std::chrono::milliseconds(5));
    }
    return true;
  }

  bool WaitEntered(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return entered_; });
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    open_    = false;
  bool                    entered_ = false;
};

class FakeSourceProvider final : public pipeline::SourceProvider {
 public:
  std::string Fetch(const pipeline::SourceChange& change, const pipeline::CancellationToken& token) override {
    {
      std::lock_guard lock(mutex_);
      fetched.push_back(change.revision);
    }
    if (fail) {
      throw std::runtime_error("repository unreachable");
    }
    if (gate && !gate->Wait(token)) {
      throw pipeline::OperationCancelled(token.Reason(), "fetch interrupted");
    }
    return "workspace/" + change.revision;
  }

  std::vector<std::string> Fetched() {
    std::lock_guard lock(mutex_);
    return fetched;
  }

  bool  fail = false;
  Gate* gate = nullptr;

 private:
  std::mutex               mutex_;
  std::vector<std::string> fetched;
};

class FakeBuildToolchain final : public pipeline::BuildToolchain {
 public:
  void RunPhase(pipeline::BuildPhase phase, const pipeline::BuildEnvironment& env, const std::string&,
                const pipeline::CancellationToken& token) override {
    {
      std::lock_guard lock(mutex_);
      calls_.push_back({phase, env.count("RESOLVED_SOURCE_VERSION") ? env.at("RESOLVED_SOURCE_VERSION") : ""});
      last_env_ = env;
    }

    auto gate = gates.find(phase);
    if (gate != gates.end() && !gate->second->Wait(token)) {
      throw pipeline::OperationCancelled(token.Reason(), "phase interrupted");
    }
    if (fail_phase && *fail_phase == phase) {
      throw std::runtime_error("exit status 1");
    }
  }

  std::vector<pipeline::BuildPhase> Phases() {
    std::lock_guard                   lock(mutex_);
    std::vector<pipeline::BuildPhase> out;
    for (const auto& call : calls_) out.push_back(call.phase);
    return out;
  }

  // Revisions in the order their install phase started.
  std::vector<std::string> InstalledRevisions() {
    std::lock_guard          lock(mutex_);
    std::vector<std::string> out;
    for (const auto& call : calls_) {
      if (call.phase == pipeline::BuildPhase::kInstall) out.push_back(call.revision);
    }
    return out;
  }

  pipeline::BuildEnvironment LastEnvironment() {
    std::lock_guard lock(mutex_);
    return last_env_;
  }

  std::optional<pipeline::BuildPhase>     fail_phase;
  std::map<pipeline::BuildPhase, Gate*>   gates;

 private:
  struct Call {
    pipeline::BuildPhase phase;
    std::string          revision;
  };

  std::mutex                 mutex_;
  std::vector<Call>          calls_;
  pipeline::BuildEnvironment last_env_;
};

class FakeFunctionDeployer final : public pipeline::FunctionDeployer {
 public:
  std::vector<pipeline::FunctionOutcome> Invoke(const std::string& target, const std::map<std::string, std::string>& parameters,
                                                const std::string&, const pipeline::CancellationToken& token) override {
    {
      std::lock_guard lock(mutex_);
      targets.push_back(target);
      last_parameters = parameters;
    }
    if (gate && !gate->Wait(token)) {
      throw pipeline::OperationCancelled(token.Reason(), "invoke interrupted");
    }
    if (fail) {
      throw std::runtime_error("invoke returned 500");
    }
    return outcomes;
  }

  std::vector<pipeline::FunctionOutcome> outcomes;
  bool                                   fail = false;
  Gate*                                  gate = nullptr;

  std::vector<std::string>           targets;
  std::map<std::string, std::string> last_parameters;

 private:
  std::mutex mutex_;
};

class FakeContainerOrchestrator final : public pipeline::ContainerOrchestrator {
 public:
  // A rollout to `slow_image` ignores the token and lands after `slow_delay`,
  // the way a service keeps rolling once the update was accepted.
  void RollingUpdate(const pipeline::RollingUpdateRequest& request, const pipeline::CancellationToken&) override {
    std::chrono::milliseconds delay{0};
    {
      std::lock_guard lock(mutex_);
      requests.push_back(request);
      if (fail) {
        throw std::runtime_error("deployment circuit breaker tripped");
      }
      if (!request.images.empty() && request.images.front().image_uri == slow_image) {
        delay = slow_delay;
      }
    }
    std::this_thread::sleep_for(delay);

    std::lock_guard lock(mutex_);
    if (!request.images.empty()) running_ = request.images.front().image_uri;
  }

  void SlowRollout(const std::string& image, std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    slow_image = image;
    slow_delay = delay;
  }

  std::string Running() {
    std::lock_guard lock(mutex_);
    return running_;
  }

  std::vector<pipeline::RollingUpdateRequest> Requests() {
    std::lock_guard lock(mutex_);
    return requests;
  }

  bool                                       fail = false;
  std::vector<pipeline::RollingUpdateRequest> requests;

 private:
  std::mutex                mutex_;
  std::string               slow_image;
  std::chrono::milliseconds slow_delay{0};
  std::string               running_;
};

} // namespace shopstack::testing
