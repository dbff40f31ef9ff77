#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace shopstack::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                                InsertExecution(Transaction&, const model::ExecutionRecord&) override;
  Result                                UpdateExecution(Transaction&, const model::ExecutionRecord&) override;
  std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string&) override;
  std::vector<model::ExecutionRecord>   ListExecutions(Transaction&, const std::string& pipeline) override;

  Result                              UpsertRelease(Transaction&, const model::ReleaseRecord&) override;
  std::optional<model::ReleaseRecord> GetRelease(Transaction&, const std::string&) override;
  std::vector<model::ReleaseRecord>   ListReleases(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ExecutionRecord> executions;
    // insertion order, used for newest-first listing
    std::vector<std::string>                              execution_order;
    std::unordered_map<std::string, model::ReleaseRecord> releases;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace shopstack::db::memory
