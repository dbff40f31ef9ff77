#include "pipeline_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace shopstack::pipeline {

using db::model::ExecutionRecord;
using db::model::ReleaseRecord;
using db::model::StageFailureRecord;
using observability::BoolField;
using observability::IntField;
using observability::StringField;
using shopstack::model::CanTransition;
using shopstack::model::IsTerminal;
using shopstack::model::PipelineStage;

namespace {

std::string KindFor(CancelReason reason) {
  switch (reason) {
    case CancelReason::kTimeout:
      return "timeout";
    case CancelReason::kShutdown:
      return "interrupted";
    default:
      return "cancelled";
  }
}

std::string Ended(CancelReason reason) {
  switch (reason) {
    case CancelReason::kTimeout:
      return "timed out";
    case CancelReason::kShutdown:
      return "was interrupted by shutdown";
    default:
      return "was cancelled";
  }
}

std::string StageName(PipelineStage stage) {
  return std::string(shopstack::model::ToString(stage));
}

} // namespace

PipelineOrchestrator::PipelineOrchestrator(PipelineOptions options, Collaborators collaborators, std::shared_ptr<db::Repository> repository)
    : options_(std::move(options)),
      collaborators_(std::move(collaborators)),
      repository_(std::move(repository)),
      build_stage_(collaborators_.toolchain, options_.build),
      deploy_stage_(collaborators_.functions, collaborators_.containers, options_.deploy) {
  if (!repository_) {
    throw std::invalid_argument("pipeline orchestrator requires a repository");
  }
  if (!collaborators_.source || !collaborators_.toolchain) {
    throw std::invalid_argument("pipeline orchestrator requires a source provider and a build toolchain");
  }
}

PipelineOrchestrator::~PipelineOrchestrator() {
  Stop();
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void PipelineOrchestrator::Start() {
  if (running_.exchange(true)) return;

  {
    std::lock_guard lock(mutex_);
    auto            history = ListLocked();
    // oldest first so the queue keeps trigger order
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
      auto& record = *it;
      if (IsTerminal(record.stage)) continue;
      if (record.queued) {
        scheduler_.Enqueue(record.id);
        continue;
      }
      FailLocked(record, record.stage, "", "interrupted", "process stopped while the stage was running");
    }
  }
  PublishQueueDepth();

  thread_ = std::thread(&PipelineOrchestrator::Run, this);
  SHOPSTACK_LOG_INFO("pipeline worker started", {StringField("pipeline", options_.name), StringField("branch", options_.branch)});
}

void PipelineOrchestrator::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (active_ && active_->stage != PipelineStage::kDeploy) {
      active_->token.Cancel(CancelReason::kShutdown);
    }
  }
  scheduler_.Shutdown();
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
    SHOPSTACK_LOG_INFO("pipeline worker stopped", {StringField("pipeline", options_.name)});
  }
}

void PipelineOrchestrator::Run() {
  while (running_) {
    auto execution_id = scheduler_.Dequeue();
    if (!execution_id) break;
    PublishQueueDepth();

    try {
      Execute(*execution_id);
    } catch (const std::exception& e) {
      SHOPSTACK_LOG_ERROR("pipeline execution aborted", {StringField("execution_id", *execution_id), StringField("error", e.what())});
    }

    {
      std::lock_guard lock(mutex_);
      active_.reset();
    }
    changed_.notify_all();
  }
}

// ------------------------------------------------------------
// Public operations
// ------------------------------------------------------------

std::optional<ExecutionRecord> PipelineOrchestrator::Trigger(const SourceChange& change) {
  if (change.branch != options_.branch) {
    SHOPSTACK_LOG_INFO("ignoring change on unwatched branch",
                       {StringField("pipeline", options_.name), StringField("branch", change.branch), StringField("revision", change.revision)});
    return std::nullopt;
  }
  if (change.revision.empty()) {
    throw util::InvalidState("trigger requires a revision");
  }

  ExecutionRecord record;
  record.id            = util::NewExecutionId();
  record.pipeline      = options_.name;
  record.branch        = change.branch;
  record.revision      = change.revision;
  record.stage         = PipelineStage::kSource;
  record.queued        = true;
  record.created_at_ms = util::NowMillis();
  record.updated_at_ms = record.created_at_ms;

  {
    std::lock_guard lock(mutex_);
    auto            tx     = repository_->Begin();
    auto            result = repository_->InsertExecution(*tx, record);
    if (!result) {
      if (result.code == db::ErrorCode::AlreadyExists) throw util::AlreadyExists("execution " + record.id);
      throw std::runtime_error("insert execution: " + result.Describe());
    }
    tx->Commit();
    scheduler_.Enqueue(record.id);
  }
  PublishQueueDepth();

  SHOPSTACK_LOG_INFO("execution queued", {StringField("execution_id", record.id), StringField("pipeline", options_.name),
                                          StringField("revision", record.revision), IntField("queue_depth", static_cast<std::int64_t>(scheduler_.Size()))});
  return record;
}

ExecutionRecord PipelineOrchestrator::Cancel(const std::string& execution_id) {
  std::unique_lock lock(mutex_);

  auto record = LoadLocked(execution_id);
  if (!record) {
    throw util::NotFound("execution " + execution_id);
  }
  if (IsTerminal(record->stage)) {
    throw util::InvalidState("execution " + execution_id + " is already " + StageName(record->stage));
  }

  if (active_ && active_->id == execution_id) {
    if (active_->stage == PipelineStage::kDeploy) {
      throw util::InvalidState("execution " + execution_id + " is deploying and cannot be cancelled");
    }
    active_->token.Cancel(CancelReason::kCancelled);
    SHOPSTACK_LOG_WARN("cancellation requested",
                       {StringField("execution_id", execution_id), StringField("stage", StageName(active_->stage))});
    return *record;
  }

  if (record->queued) {
    if (scheduler_.Remove(execution_id)) {
      FailLocked(*record, PipelineStage::kSource, "", "cancelled", "cancelled while queued");
      lock.unlock();
      changed_.notify_all();
      PublishQueueDepth();
      return *record;
    }
    // Dequeued but not started yet; the worker picks this up on activation.
    pending_cancel_.insert(execution_id);
    return *record;
  }

  throw util::InvalidState("execution " + execution_id + " is not owned by a running worker");
}

ExecutionRecord PipelineOrchestrator::Get(const std::string& execution_id) {
  std::lock_guard lock(mutex_);
  auto            record = LoadLocked(execution_id);
  if (!record) {
    throw util::NotFound("execution " + execution_id);
  }
  return *record;
}

std::vector<ExecutionRecord> PipelineOrchestrator::List(size_t limit) {
  std::lock_guard lock(mutex_);
  auto            records = ListLocked();
  if (limit > 0 && records.size() > limit) {
    records.resize(limit);
  }
  return records;
}

std::vector<ReleaseRecord> PipelineOrchestrator::Releases() {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return repository_->ListReleases(*tx);
}

bool PipelineOrchestrator::WaitForTerminal(const std::string& execution_id, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return changed_.wait_for(lock, timeout, [&] {
    auto record = LoadLocked(execution_id);
    return record && IsTerminal(record->stage);
  });
}

// ------------------------------------------------------------
// Execution
// ------------------------------------------------------------

template <typename Fn>
auto PipelineOrchestrator::RunStage(PipelineStage stage, std::chrono::milliseconds timeout, const CancellationToken& token, Fn&& work)
    -> decltype(work()) {
  observability::SpanScope span("pipeline." + StageName(stage));
  span.SetAttribute("pipeline", options_.name);
  const auto started_at = std::chrono::steady_clock::now();

  auto future = std::async(std::launch::async, std::forward<Fn>(work));
  if (future.wait_for(timeout) == std::future_status::timeout) {
    if (token.Cancel(CancelReason::kTimeout)) {
      SHOPSTACK_LOG_WARN("stage timed out, waiting for stage work to stop",
                         {StringField("pipeline", options_.name), StringField("stage", StageName(stage)), IntField("timeout_ms", timeout.count())});
    }
    future.wait();
  }

  observability::Metrics::Instance().ObserveStageDurationMs(
      StageName(stage), std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

  if (token.IsCancelled()) {
    try {
      future.get();
    } catch (const std::exception& e) {
      SHOPSTACK_LOG_DEBUG("stage work ended after cancellation", {StringField("stage", StageName(stage)), StringField("error", e.what())});
    }
    span.RecordException(KindFor(token.Reason()));
    throw OperationCancelled(token.Reason(), StageName(stage) + " stage " + Ended(token.Reason()));
  }

  return future.get();
}

void PipelineOrchestrator::Execute(const std::string& execution_id) {
  CancellationToken token;
  ExecutionRecord   record;
  {
    std::lock_guard lock(mutex_);
    auto            loaded = LoadLocked(execution_id);
    if (!loaded || IsTerminal(loaded->stage)) return;
    record = std::move(*loaded);

    active_ = ActiveExecution{execution_id, PipelineStage::kSource, token};
    if (pending_cancel_.erase(execution_id) > 0) {
      token.Cancel(CancelReason::kCancelled);
    }
    record.queued = false;
    PersistLocked(record);
  }
  changed_.notify_all();

  SHOPSTACK_LOG_INFO("execution started", {StringField("execution_id", record.id), StringField("stage", "Source"),
                                           StringField("revision", record.revision)});

  // ---------------- Source ----------------
  std::string source_artifact;
  try {
    const SourceChange change{record.branch, record.revision};
    source_artifact = RunStage(PipelineStage::kSource, options_.timeouts.source, token, [&] {
      ThrowIfCancelled(token, "source fetch");
      return collaborators_.source->Fetch(change, token);
    });
  } catch (const OperationCancelled& e) {
    Fail(record, PipelineStage::kSource, "fetch", KindFor(e.reason()), e.what());
    return;
  } catch (const std::exception& e) {
    Fail(record, PipelineStage::kSource, "fetch", "source_error", e.what());
    return;
  }

  record.source_artifact = source_artifact;
  if (!Advance(record, PipelineStage::kBuild, token)) return;

  // ---------------- Build ----------------
  BuildOutput build;
  std::string current_phase;
  try {
    build = RunStage(PipelineStage::kBuild, options_.timeouts.build, token, [&] {
      return build_stage_.Run(record.revision, source_artifact, token, [&](BuildPhase phase) {
        current_phase = std::string(ToString(phase));
        SHOPSTACK_LOG_INFO("build phase started",
                           {StringField("execution_id", record.id), StringField("stage", "Build"), StringField("phase", current_phase)});
      });
    });
  } catch (const util::PipelineStageError& e) {
    Fail(record, PipelineStage::kBuild, e.phase(), "build_error", e.what());
    return;
  } catch (const OperationCancelled& e) {
    Fail(record, PipelineStage::kBuild, current_phase, KindFor(e.reason()), e.what());
    return;
  } catch (const std::exception& e) {
    Fail(record, PipelineStage::kBuild, current_phase, "build_error", e.what());
    return;
  }

  record.build_artifact = build.artifact;
  if (!Advance(record, PipelineStage::kDeploy, token)) return;

  // ---------------- Deploy ----------------
  try {
    auto outcome = RunStage(PipelineStage::kDeploy, options_.timeouts.deploy, token,
                            [&] { return deploy_stage_.Run(record.revision, record.build_artifact, token); });
    Succeed(record, outcome.running_artifact);
  } catch (const PartialDeploymentError& e) {
    record.partial_deployment = true;
    Fail(record, PipelineStage::kDeploy, "invoke", "partial_deployment", e.what());
  } catch (const util::DescriptorError& e) {
    Fail(record, PipelineStage::kDeploy, "validate_descriptor", "descriptor_error", e.what());
  } catch (const util::PipelineStageError& e) {
    Fail(record, PipelineStage::kDeploy, e.phase(), "deploy_error", e.what());
  } catch (const OperationCancelled& e) {
    // The rollout may have gone through after the deadline.
    std::string message = e.what();
    if (e.reason() == CancelReason::kTimeout) {
      message += "; " + RestorePreviousRelease(record);
    }
    Fail(record, PipelineStage::kDeploy, "", KindFor(e.reason()), message);
  } catch (const std::exception& e) {
    Fail(record, PipelineStage::kDeploy, "", "deploy_error", e.what());
  }
}

std::string PipelineOrchestrator::RestorePreviousRelease(const ExecutionRecord& record) {
  const auto& target = options_.deploy.target;

  std::optional<ReleaseRecord> previous;
  {
    std::lock_guard lock(mutex_);
    auto            tx = repository_->Begin();
    previous           = repository_->GetRelease(*tx, target);
  }
  if (!previous) {
    SHOPSTACK_LOG_ERROR("deploy timed out and no earlier release exists to restore",
                        {StringField("execution_id", record.id), StringField("target", target), StringField("revision", record.revision)});
    return "no earlier release of " + target + " to restore";
  }

  CancellationToken restore_token;
  try {
    RunStage(PipelineStage::kDeploy, options_.timeouts.deploy, restore_token,
             [&] { deploy_stage_.Restore(previous->artifact, restore_token); });
  } catch (const std::exception& e) {
    SHOPSTACK_LOG_ERROR("restoring the earlier release failed",
                        {StringField("execution_id", record.id), StringField("target", target), StringField("artifact", previous->artifact),
                         StringField("revision", record.revision), StringField("error", e.what())});
    return "restoring " + previous->artifact + " failed: " + e.what();
  }

  SHOPSTACK_LOG_WARN("earlier release restored after deploy timeout",
                     {StringField("execution_id", record.id), StringField("target", target), StringField("artifact", previous->artifact),
                      StringField("restored_revision", previous->revision)});
  return "restored " + previous->artifact + " from revision " + previous->revision;
}

bool PipelineOrchestrator::Advance(ExecutionRecord& record, PipelineStage next, const CancellationToken& token) {
  {
    std::lock_guard lock(mutex_);
    if (token.IsCancelled()) {
      FailLocked(record, record.stage, "", KindFor(token.Reason()), "execution " + Ended(token.Reason()) + " before " + StageName(next));
    } else {
      TransitionLocked(record, next);
      if (active_) active_->stage = next;
      PersistLocked(record);
    }
  }
  changed_.notify_all();

  if (IsTerminal(record.stage)) return false;
  SHOPSTACK_LOG_INFO("stage entered", {StringField("execution_id", record.id), StringField("stage", StageName(next))});
  return true;
}

void PipelineOrchestrator::Fail(ExecutionRecord& record, PipelineStage stage, const std::string& phase, const std::string& kind,
                                const std::string& message) {
  {
    std::lock_guard lock(mutex_);
    FailLocked(record, stage, phase, kind, message);
  }
  changed_.notify_all();
}

void PipelineOrchestrator::Succeed(ExecutionRecord& record, const std::string& running_artifact) {
  {
    std::lock_guard lock(mutex_);
    TransitionLocked(record, PipelineStage::kSucceeded);

    ReleaseRecord release;
    release.target        = options_.deploy.target;
    release.artifact      = running_artifact;
    release.revision      = record.revision;
    release.execution_id  = record.id;
    release.updated_at_ms = util::NowMillis();
    PersistLocked(record, release);
  }
  changed_.notify_all();

  observability::Metrics::Instance().RecordExecutionOutcome(options_.name, "succeeded");
  SHOPSTACK_LOG_INFO("execution succeeded", {StringField("execution_id", record.id), StringField("stage", "Succeeded"),
                                             StringField("target", options_.deploy.target), StringField("revision", record.revision)});
}

// ------------------------------------------------------------
// Locked helpers (mutex_ held)
// ------------------------------------------------------------

void PipelineOrchestrator::TransitionLocked(ExecutionRecord& record, PipelineStage next) {
  if (!CanTransition(record.stage, next)) {
    throw util::InvalidState("illegal transition " + StageName(record.stage) + " -> " + StageName(next) + " for execution " + record.id);
  }
  record.stage = next;
}

void PipelineOrchestrator::FailLocked(ExecutionRecord& record, PipelineStage stage, const std::string& phase, const std::string& kind,
                                      const std::string& message) {
  TransitionLocked(record, PipelineStage::kFailed);
  record.queued  = false;
  record.failure = StageFailureRecord{stage, phase, message, kind};
  PersistLocked(record);

  observability::Metrics::Instance().RecordExecutionOutcome(options_.name, kind);
  SHOPSTACK_LOG_ERROR("execution failed", {StringField("execution_id", record.id), StringField("stage", StageName(stage)),
                                           StringField("phase", phase), StringField("kind", kind), StringField("error", message),
                                           BoolField("partial_deployment", record.partial_deployment)});
}

void PipelineOrchestrator::PersistLocked(ExecutionRecord& record, const std::optional<ReleaseRecord>& release) {
  record.updated_at_ms = util::NowMillis();

  auto tx     = repository_->Begin();
  auto result = repository_->UpdateExecution(*tx, record);
  if (!result) {
    throw std::runtime_error("persist execution " + record.id + ": " + result.Describe());
  }
  if (release) {
    result = repository_->UpsertRelease(*tx, *release);
    if (!result) {
      throw std::runtime_error("persist release for " + release->target + ": " + result.Describe());
    }
  }
  tx->Commit();
}

std::optional<ExecutionRecord> PipelineOrchestrator::LoadLocked(const std::string& execution_id) {
  auto tx = repository_->Begin();
  return repository_->GetExecution(*tx, execution_id);
}

std::vector<ExecutionRecord> PipelineOrchestrator::ListLocked() {
  auto tx = repository_->Begin();
  return repository_->ListExecutions(*tx, options_.name);
}

void PipelineOrchestrator::PublishQueueDepth() {
  observability::Metrics::Instance().SetQueueDepth(options_.name, scheduler_.Size());
}

} // namespace shopstack::pipeline
