#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace shopstack::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.executions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  s.executions[r.id] = r;
  s.execution_order.push_back(r.id);
  return Result::Ok();
}

Result MemoryRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.executions.find(r.id);
  if (it == s.executions.end()) return Result::Err(ErrorCode::NotFound, r.id);
  it->second = r;
  return Result::Ok();
}

std::optional<model::ExecutionRecord> MemoryRepository::GetExecution(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.executions.find(id);
  if (it == s.executions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ExecutionRecord> MemoryRepository::ListExecutions(Transaction& t, const std::string& pipeline) {
  const auto&                         s = TX(t).View();
  std::vector<model::ExecutionRecord> out;
  for (auto it = s.execution_order.rbegin(); it != s.execution_order.rend(); ++it) {
    const auto& record = s.executions.at(*it);
    if (pipeline.empty() || record.pipeline == pipeline) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::UpsertRelease(Transaction& t, const model::ReleaseRecord& r) {
  TX(t).Mutable().releases[r.target] = r;
  return Result::Ok();
}

std::optional<model::ReleaseRecord> MemoryRepository::GetRelease(Transaction& t, const std::string& target) {
  const auto& s  = TX(t).View();
  auto        it = s.releases.find(target);
  if (it == s.releases.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ReleaseRecord> MemoryRepository::ListReleases(Transaction& t) {
  std::vector<model::ReleaseRecord> out;
  for (const auto& [_, record] : TX(t).View().releases) {
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.target < b.target; });
  return out;
}

} // namespace shopstack::db::memory
