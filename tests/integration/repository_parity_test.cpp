#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if SHOPSTACK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using shopstack::db::ErrorCode;
using shopstack::db::Repository;
using shopstack::db::memory::MemoryRepository;
using shopstack::db::model::ExecutionRecord;
using shopstack::db::model::ReleaseRecord;
using shopstack::db::model::StageFailureRecord;
using shopstack::model::PipelineStage;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

ExecutionRecord MakeExecution(const std::string& id, const std::string& pipeline, const std::string& revision) {
  ExecutionRecord record;
  record.id            = id;
  record.pipeline      = pipeline;
  record.branch        = "main";
  record.revision      = revision;
  record.created_at_ms = NowMs();
  record.updated_at_ms = record.created_at_ms;
  return record;
}

void VerifyExecutionLifecycle(Repository& repo, const std::string& id) {
  auto tx = repo.Begin();

  auto record = MakeExecution(id, "lifecycle", "abc123");
  assert(repo.InsertExecution(*tx, record));

  auto resolved = repo.GetExecution(*tx, id);
  assert(resolved.has_value());
  assert(*resolved == record);
  assert(!resolved->failure.has_value());

  record.stage              = PipelineStage::kFailed;
  record.queued             = false;
  record.source_artifact    = "workspace/abc123";
  record.build_artifact     = R"([{"name":"web","imageUri":"repo:abc123"}])";
  record.partial_deployment = true;
  record.failure            = StageFailureRecord{PipelineStage::kDeploy, "invoke", "orders failed", "partial_deployment"};
  record.updated_at_ms      = record.created_at_ms + 10;
  assert(repo.UpdateExecution(*tx, record));

  auto updated = repo.GetExecution(*tx, id);
  assert(updated.has_value());
  assert(*updated == record);

  const auto duplicate = repo.InsertExecution(*tx, record);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  const auto missing = repo.UpdateExecution(*tx, MakeExecution(id + "-missing", "lifecycle", "abc123"));
  assert(missing.code == ErrorCode::NotFound);
  assert(!repo.GetExecution(*tx, id + "-missing").has_value());

  tx->Commit();
}

void VerifyListNewestFirst(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  const auto pipeline = prefix + "-pipeline";
  assert(repo.InsertExecution(*tx, MakeExecution(prefix + "-1", pipeline, "r1")));
  assert(repo.InsertExecution(*tx, MakeExecution(prefix + "-other", prefix + "-other-pipeline", "r1")));
  assert(repo.InsertExecution(*tx, MakeExecution(prefix + "-2", pipeline, "r2")));
  assert(repo.InsertExecution(*tx, MakeExecution(prefix + "-3", pipeline, "r3")));

  const auto listed = repo.ListExecutions(*tx, pipeline);
  assert(listed.size() == 3);
  assert(listed[0].id == prefix + "-3");
  assert(listed[2].id == prefix + "-1");

  const auto everything = repo.ListExecutions(*tx, "");
  assert(everything.size() >= 4);
  assert(everything[0].id == prefix + "-3");

  tx->Commit();
}

void VerifyReleaseUpsert(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  assert(repo.InsertExecution(*tx, MakeExecution(prefix + "-first", "releases", "r1")));
  assert(repo.InsertExecution(*tx, MakeExecution(prefix + "-second", "releases", "r2")));

  const auto    target = prefix + "-products";
  ReleaseRecord release{target, "workspace/r1", "r1", prefix + "-first", NowMs()};
  assert(repo.UpsertRelease(*tx, release));
  assert(*repo.GetRelease(*tx, target) == release);

  release = ReleaseRecord{target, "workspace/r2", "r2", prefix + "-second", NowMs() + 1};
  assert(repo.UpsertRelease(*tx, release));
  assert(*repo.GetRelease(*tx, target) == release);

  assert(repo.UpsertRelease(*tx, ReleaseRecord{prefix + "-cart", "workspace/r1", "r1", prefix + "-first", NowMs()}));
  const auto releases = repo.ListReleases(*tx);
  assert(releases.size() >= 2);
  for (size_t i = 1; i < releases.size(); ++i) {
    assert(releases[i - 1].target < releases[i].target);
  }
  assert(!repo.GetRelease(*tx, prefix + "-missing").has_value());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertExecution(*tx, MakeExecution(id, "rollback", "r1")));
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = repo.Begin();
    assert(repo.InsertExecution(*tx, MakeExecution(id + "-dropped", "rollback", "r1")));
  }

  auto tx = repo.Begin();
  assert(!repo.GetExecution(*tx, id).has_value());
  assert(!repo.GetExecution(*tx, id + "-dropped").has_value());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) return;

  auto repo = backend.make_repository();
  {
    auto tx     = repo->Begin();
    auto record = MakeExecution(id, "durable", "r1");
    assert(repo->InsertExecution(*tx, record));
    assert(repo->UpsertRelease(*tx, ReleaseRecord{id + "-target", "workspace/r1", "r1", id, NowMs()}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetExecution(*tx, id).has_value());
  assert(repo->GetRelease(*tx, id + "-target")->execution_id == id);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if SHOPSTACK_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("shopstack_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<shopstack::db::sqlite::SqliteDB>(db_path);
    shopstack::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<shopstack::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyExecutionLifecycle(*repo, backend.name + "-lifecycle");
    VerifyListNewestFirst(*repo, backend.name + "-list");
    VerifyReleaseUpsert(*repo, backend.name + "-release");
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  }

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SHOPSTACK_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "shopstack_integration_repository_parity: pass\n";
  return 0;
}
