#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace shopstack::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    SHOPSTACK_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace shopstack::db::sqlite
