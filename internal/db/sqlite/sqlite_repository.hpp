#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace shopstack::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the execution and release tables if missing.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result                                InsertExecution(Transaction&, const model::ExecutionRecord&) override;
  Result                                UpdateExecution(Transaction&, const model::ExecutionRecord&) override;
  std::optional<model::ExecutionRecord> GetExecution(Transaction&, const std::string&) override;
  std::vector<model::ExecutionRecord>   ListExecutions(Transaction&, const std::string& pipeline) override;

  Result                              UpsertRelease(Transaction&, const model::ReleaseRecord&) override;
  std::optional<model::ReleaseRecord> GetRelease(Transaction&, const std::string&) override;
  std::vector<model::ReleaseRecord>   ListReleases(Transaction&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace shopstack::db::sqlite
