#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/execution_record.hpp"
#include "internal/db/model/release_record.hpp"

namespace shopstack::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Release rows are only written together with the execution that
    produced them

  The DB is the source of truth for:
    execution history
    running artifact per deploy target
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Pipeline executions
  // ---------------------------------------------------------------------

  virtual Result InsertExecution(Transaction&, const model::ExecutionRecord&) = 0;

  virtual Result UpdateExecution(Transaction&, const model::ExecutionRecord&) = 0;

  virtual std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string& id) = 0;

  // Newest first.
  virtual std::vector<model::ExecutionRecord> ListExecutions(Transaction&, const std::string& pipeline) = 0;

  // ---------------------------------------------------------------------
  // Running artifacts
  // ---------------------------------------------------------------------

  virtual Result UpsertRelease(Transaction&, const model::ReleaseRecord&) = 0;

  virtual std::optional<model::ReleaseRecord> GetRelease(Transaction&, const std::string& target) = 0;

  virtual std::vector<model::ReleaseRecord> ListReleases(Transaction&) = 0;
};

} // namespace shopstack::db
