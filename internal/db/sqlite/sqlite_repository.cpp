#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace shopstack::db::sqlite {

using shopstack::db::ErrorCode;
using shopstack::db::Result;
using shopstack::model::PipelineStage;

namespace {

constexpr const char* kExecutionColumns =
    "id,pipeline,branch,revision,stage,queued,source_artifact,build_artifact,"
    "failure_stage,failure_phase,failure_message,failure_kind,partial_deployment,created_at_ms,updated_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

// Owns a prepared statement for the duration of one call.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) st_ = nullptr;
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }
  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  explicit operator bool() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

// Binds the 14 non-id columns, in kExecutionColumns order, starting at `first`.
void BindExecutionBody(sqlite3_stmt* st, const model::ExecutionRecord& r, int first) {
  BindText(st, first + 0, r.pipeline);
  BindText(st, first + 1, r.branch);
  BindText(st, first + 2, r.revision);
  BindI32(st, first + 3, static_cast<int>(r.stage));
  BindI32(st, first + 4, r.queued ? 1 : 0);
  BindText(st, first + 5, r.source_artifact);
  BindText(st, first + 6, r.build_artifact);
  if (r.failure) {
    BindI32(st, first + 7, static_cast<int>(r.failure->stage));
    BindText(st, first + 8, r.failure->phase);
    BindText(st, first + 9, r.failure->message);
    BindText(st, first + 10, r.failure->kind);
  } else {
    sqlite3_bind_null(st, first + 7);
    sqlite3_bind_null(st, first + 8);
    sqlite3_bind_null(st, first + 9);
    sqlite3_bind_null(st, first + 10);
  }
  BindI32(st, first + 11, r.partial_deployment ? 1 : 0);
  BindU64(st, first + 12, r.created_at_ms);
  BindU64(st, first + 13, r.updated_at_ms);
}

model::ExecutionRecord ReadExecution(sqlite3_stmt* st) {
  model::ExecutionRecord r;
  r.id              = ColText(st, 0);
  r.pipeline        = ColText(st, 1);
  r.branch          = ColText(st, 2);
  r.revision        = ColText(st, 3);
  r.stage           = static_cast<PipelineStage>(ColI32(st, 4));
  r.queued          = ColI32(st, 5) != 0;
  r.source_artifact = ColText(st, 6);
  r.build_artifact  = ColText(st, 7);
  if (sqlite3_column_type(st, 8) != SQLITE_NULL) {
    model::StageFailureRecord failure;
    failure.stage   = static_cast<PipelineStage>(ColI32(st, 8));
    failure.phase   = ColText(st, 9);
    failure.message = ColText(st, 10);
    failure.kind    = ColText(st, 11);
    r.failure       = std::move(failure);
  }
  r.partial_deployment = ColI32(st, 12) != 0;
  r.created_at_ms      = ColU64(st, 13);
  r.updated_at_ms      = ColU64(st, 14);
  return r;
}

model::ReleaseRecord ReadRelease(sqlite3_stmt* st) {
  model::ReleaseRecord r;
  r.target        = ColText(st, 0);
  r.artifact      = ColText(st, 1);
  r.revision      = ColText(st, 2);
  r.execution_id  = ColText(st, 3);
  r.updated_at_ms = ColU64(st, 4);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  db.Exec(
      "CREATE TABLE IF NOT EXISTS pipeline_executions (id TEXT PRIMARY KEY, pipeline TEXT NOT NULL, branch TEXT NOT NULL, revision TEXT NOT "
      "NULL, stage INTEGER NOT NULL, queued INTEGER NOT NULL, source_artifact TEXT, build_artifact TEXT, failure_stage INTEGER, failure_phase "
      "TEXT, failure_message TEXT, failure_kind TEXT, partial_deployment INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, "
      "updated_at_ms INTEGER NOT NULL);");
  db.Exec("CREATE INDEX IF NOT EXISTS pipeline_executions_by_pipeline ON pipeline_executions(pipeline);");
  db.Exec(
      "CREATE TABLE IF NOT EXISTS releases (target TEXT PRIMARY KEY, artifact TEXT NOT NULL, revision TEXT NOT NULL, execution_id TEXT NOT "
      "NULL REFERENCES pipeline_executions(id), updated_at_ms INTEGER NOT NULL);");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Executions
// ------------------------------------------------------------------

Result SqliteRepository::InsertExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("INSERT INTO pipeline_executions(") + kExecutionColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindExecutionBody(st.get(), r, 2);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateExecution(Transaction& t, const model::ExecutionRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE pipeline_executions SET pipeline=?,branch=?,revision=?,stage=?,queued=?,source_artifact=?,build_artifact=?,"
               "failure_stage=?,failure_phase=?,failure_message=?,failure_kind=?,partial_deployment=?,created_at_ms=?,updated_at_ms=? "
               "WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindExecutionBody(st.get(), r, 1);
  BindText(st.get(), 15, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, r.id);
  return result;
}

std::optional<model::ExecutionRecord> SqliteRepository::GetExecution(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kExecutionColumns + " FROM pipeline_executions WHERE id=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadExecution(st.get());
}

std::vector<model::ExecutionRecord> SqliteRepository::ListExecutions(Transaction& t, const std::string& pipeline) {
  auto* db = TX(t).Handle();

  std::vector<model::ExecutionRecord> out;
  Statement                           st(db, std::string("SELECT ") + kExecutionColumns +
                                                 " FROM pipeline_executions WHERE (?1 = '' OR pipeline = ?1) ORDER BY rowid DESC;");
  if (!st) return out;

  BindText(st.get(), 1, pipeline);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadExecution(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Releases
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRelease(Transaction& t, const model::ReleaseRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO releases(target,artifact,revision,execution_id,updated_at_ms) VALUES(?,?,?,?,?)"
               " ON CONFLICT(target) DO UPDATE SET artifact=excluded.artifact, revision=excluded.revision,"
               " execution_id=excluded.execution_id, updated_at_ms=excluded.updated_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.target);
  BindText(st.get(), 2, r.artifact);
  BindText(st.get(), 3, r.revision);
  BindText(st.get(), 4, r.execution_id);
  BindU64(st.get(), 5, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ReleaseRecord> SqliteRepository::GetRelease(Transaction& t, const std::string& target) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT target,artifact,revision,execution_id,updated_at_ms FROM releases WHERE target=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, target);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRelease(st.get());
}

std::vector<model::ReleaseRecord> SqliteRepository::ListReleases(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::ReleaseRecord> out;
  Statement                         st(db, "SELECT target,artifact,revision,execution_id,updated_at_ms FROM releases ORDER BY target;");
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadRelease(st.get()));
  }
  return out;
}

} // namespace shopstack::db::sqlite
