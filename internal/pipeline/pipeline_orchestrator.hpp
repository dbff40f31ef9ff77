#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "build_stage.hpp"
#include "collaborators.hpp"
#include "deploy_stage.hpp"
#include "internal/db/api/repository.hpp"
#include "pipeline_scheduler.hpp"

namespace shopstack::pipeline {

struct StageTimeouts {
  std::chrono::milliseconds source{std::chrono::minutes(5)};
  std::chrono::milliseconds build{std::chrono::minutes(60)};
  std::chrono::milliseconds deploy{std::chrono::minutes(30)};
};

struct PipelineOptions {
  std::string        name;
  std::string        branch;
  StageTimeouts      timeouts;
  BuildStageOptions  build;
  DeployStageOptions deploy;
};

struct Collaborators {
  std::shared_ptr<SourceProvider>        source;
  std::shared_ptr<BuildToolchain>        toolchain;
  std::shared_ptr<FunctionDeployer>      functions;
  std::shared_ptr<ContainerOrchestrator> containers;
};

/*
  Pipeline orchestrator.

  Drives executions through Source -> Build -> Deploy on one worker thread.
  Triggers queue FIFO behind the active execution; the next one starts only
  after the active one is terminal and its stage work has returned.

  Every transition is persisted before it becomes visible. The running
  artifact ledger is written in the same transaction as Succeeded.

  Cancel:
    queued, Source, Build  -> Failed (kind "cancelled")
    Deploy, terminal       -> InvalidState

  Stage timeout raises the stage token, waits for the work to return and
  fails the execution with kind "timeout". A Deploy timeout also redeploys
  the target's last release, so only a Succeeded Deploy changes what runs.

  Stop() interrupts an execution in Source or Build (kind "interrupted").
*/
class PipelineOrchestrator {
 public:
  PipelineOrchestrator(PipelineOptions options, Collaborators collaborators, std::shared_ptr<db::Repository> repository);
  ~PipelineOrchestrator();

  PipelineOrchestrator(const PipelineOrchestrator&)            = delete;
  PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

  // Re-queues executions left queued by a previous process and fails the
  // ones that were mid-stage, then starts the worker.
  void Start();
  void Stop();

  // nullopt when the branch is not watched.
  std::optional<db::model::ExecutionRecord> Trigger(const SourceChange& change);

  db::model::ExecutionRecord Cancel(const std::string& execution_id);

  db::model::ExecutionRecord              Get(const std::string& execution_id);
  std::vector<db::model::ExecutionRecord> List(size_t limit);
  std::vector<db::model::ReleaseRecord>   Releases();

  // Blocks until the execution is terminal or the timeout expires.
  bool WaitForTerminal(const std::string& execution_id, std::chrono::milliseconds timeout);

  const PipelineOptions& options() const {
    return options_;
  }

 private:
  struct ActiveExecution {
    std::string                     id;
    shopstack::model::PipelineStage stage = shopstack::model::PipelineStage::kSource;
    CancellationToken               token;
  };

  void Run();
  void Execute(const std::string& execution_id);

  // Runs `work` on its own thread under the stage timeout.
  template <typename Fn>
  auto RunStage(shopstack::model::PipelineStage stage, std::chrono::milliseconds timeout, const CancellationToken& token, Fn&& work)
      -> decltype(work());

  // Moves to `next` unless the token was raised; false when the execution failed instead.
  bool Advance(db::model::ExecutionRecord& record, shopstack::model::PipelineStage next, const CancellationToken& token);
  void Fail(db::model::ExecutionRecord& record, shopstack::model::PipelineStage stage, const std::string& phase, const std::string& kind,
            const std::string& message);
  void Succeed(db::model::ExecutionRecord& record, const std::string& running_artifact);
  // Returns a summary for the failure message.
  std::string RestorePreviousRelease(const db::model::ExecutionRecord& record);

  // *Locked helpers expect mutex_ to be held.
  void TransitionLocked(db::model::ExecutionRecord& record, shopstack::model::PipelineStage next);
  void FailLocked(db::model::ExecutionRecord& record, shopstack::model::PipelineStage stage, const std::string& phase, const std::string& kind,
                  const std::string& message);
  void PersistLocked(db::model::ExecutionRecord& record, const std::optional<db::model::ReleaseRecord>& release = std::nullopt);
  std::optional<db::model::ExecutionRecord> LoadLocked(const std::string& execution_id);
  std::vector<db::model::ExecutionRecord>   ListLocked();

  void PublishQueueDepth();

  PipelineOptions                 options_;
  Collaborators                   collaborators_;
  std::shared_ptr<db::Repository> repository_;
  BuildStage                      build_stage_;
  DeployStage                     deploy_stage_;
  PipelineScheduler               scheduler_;

  // Serializes repository writes and guards active_.
  std::mutex                     mutex_;
  std::condition_variable        changed_;
  std::optional<ActiveExecution> active_;
  // Dequeued by the worker before Cancel could remove them.
  std::set<std::string> pending_cancel_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace shopstack::pipeline
