#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/scheduler/selection_policy.hpp"

namespace jobq::db::sqlite {

using jobq::db::ErrorCode;
using jobq::db::Result;
using jobq::model::JobState;

namespace {

constexpr const char* kJobColumns =
    "id,command,state,attempts,max_retries,timeout,backoff_base,priority,waiting_time,"
    "created_at,updated_at,next_retry_at,error_message,output,execution_time,locked_by,locked_at";

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  BindText(st, idx, util::ToIso8601(tp));
}

void BindOptTime(sqlite3_stmt* st, int idx, const std::optional<util::TimePoint>& tp) {
  if (tp) {
    BindTime(st, idx, *tp);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<util::TimePoint> ColOptTime(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return util::FromIso8601(ColText(st, col));
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return ColOptTime(st, col).value_or(util::TimePoint{});
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return sqlite3_column_double(st, col);
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.id      = ColText(st, 0);
  r.command = ColText(st, 1);

  auto state = jobq::model::ParseJobState(ColText(st, 2));
  if (!state) {
    throw std::runtime_error("job " + r.id + " has unknown state '" + ColText(st, 2) + "'");
  }
  r.state = *state;

  r.attempts       = ColI64(st, 3);
  r.max_retries    = ColI64(st, 4);
  r.timeout        = ColI64(st, 5);
  r.backoff_base   = ColI64(st, 6);
  r.priority       = ColI64(st, 7);
  r.waiting_time   = ColI64(st, 8);
  r.created_at     = ColTime(st, 9);
  r.updated_at     = ColTime(st, 10);
  r.next_retry_at  = ColOptTime(st, 11);
  r.error_message  = ColOptText(st, 12);
  r.output         = ColOptText(st, 13);
  r.execution_time = ColOptDouble(st, 14);
  r.locked_by      = ColOptText(st, 15);
  r.locked_at      = ColOptTime(st, 16);
  return r;
}

std::vector<model::JobRecord> ReadJobs(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::JobRecord> out;
  int                           rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadJob(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

std::optional<model::JobRecord> ReadOptionalJob(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return ReadJob(st);
}

// Binds every column except id, starting at `idx`; returns the next free index.
int BindJobBody(sqlite3_stmt* st, int idx, const model::JobRecord& r) {
  BindText(st, idx++, r.command);
  BindText(st, idx++, jobq::model::ToString(r.state));
  BindI64(st, idx++, r.attempts);
  BindI64(st, idx++, r.max_retries);
  BindI64(st, idx++, r.timeout);
  BindI64(st, idx++, r.backoff_base);
  BindI64(st, idx++, r.priority);
  BindI64(st, idx++, r.waiting_time);
  BindTime(st, idx++, r.created_at);
  BindTime(st, idx++, r.updated_at);
  BindOptTime(st, idx++, r.next_retry_at);
  BindOptText(st, idx++, r.error_message);
  BindOptText(st, idx++, r.output);
  BindOptDouble(st, idx++, r.execution_time);
  BindOptText(st, idx++, r.locked_by);
  BindOptTime(st, idx++, r.locked_at);
  return idx;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kRead);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int ext = sqlite3_extended_errcode(db);
      if (ext == SQLITE_CONSTRAINT_PRIMARYKEY || ext == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("INSERT INTO jobs(") + kJobColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, r.id);
  BindJobBody(st.get(), 2, r);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id=?;");
  BindText(st.get(), 1, id);
  return ReadOptionalJob(db, st.get());
}

std::vector<model::JobRecord> SqliteRepository::ListJobs(Transaction& t, const JobFilter& filter) {
  auto* db = TX(t).Handle();

  std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs";
  if (filter.state) sql += " WHERE state=?";
  sql += " ORDER BY created_at DESC, id ASC;";

  auto st = Prepare(db, sql);
  if (filter.state) BindText(st.get(), 1, jobq::model::ToString(*filter.state));
  return ReadJobs(db, st.get());
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE jobs SET command=?,state=?,attempts=?,max_retries=?,timeout=?,backoff_base=?,priority=?,"
                    "waiting_time=?,created_at=?,updated_at=?,next_retry_at=?,error_message=?,output=?,execution_time=?,"
                    "locked_by=?,locked_at=? WHERE id=?;");
  const int id_idx = BindJobBody(st.get(), 1, r);
  BindText(st.get(), id_idx, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "job " + r.id + " not found");
  return Result::Ok();
}

Result SqliteRepository::DeleteJob(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "DELETE FROM jobs WHERE id=?;");
  BindText(st.get(), 1, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "job " + id + " not found");
  return Result::Ok();
}

Result SqliteRepository::DeleteJobs(Transaction& t, const JobFilter& filter, uint64_t& deleted) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, filter.state ? "DELETE FROM jobs WHERE state=?;" : "DELETE FROM jobs;");
  if (filter.state) BindText(st.get(), 1, jobq::model::ToString(*filter.state));

  auto result = Translate(db, sqlite3_step(st.get()));
  deleted     = result ? static_cast<uint64_t>(sqlite3_changes(db)) : 0;
  return result;
}

Result SqliteRepository::AgeWaitingJobs(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "UPDATE jobs SET waiting_time=waiting_time+1 WHERE state IN ('pending','failed') AND locked_by IS NULL;");
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::JobRecord> SqliteRepository::SelectNextClaimable(Transaction& t, util::TimePoint now) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, std::string("SELECT ") + kJobColumns +
                            " FROM jobs WHERE locked_by IS NULL"
                            " AND (state='pending' OR (state='failed' AND next_retry_at IS NOT NULL AND next_retry_at <= ?))"
                            " ORDER BY " +
                            scheduler::kClaimOrderSql + " LIMIT 1;");
  BindTime(st.get(), 1, now);
  return ReadOptionalJob(db, st.get());
}

Result SqliteRepository::MarkClaimed(Transaction& t, const std::string& id, const std::string& worker_id, util::TimePoint now) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db,
                    "UPDATE jobs SET state='processing',locked_by=?,locked_at=?,updated_at=?,next_retry_at=NULL "
                    "WHERE id=? AND locked_by IS NULL AND state IN ('pending','failed');");
  BindText(st.get(), 1, worker_id);
  BindTime(st.get(), 2, now);
  BindTime(st.get(), 3, now);
  BindText(st.get(), 4, id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "job " + id + " is no longer claimable");
  return Result::Ok();
}

std::map<JobState, uint64_t> SqliteRepository::CountByState(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT state, COUNT(*) FROM jobs GROUP BY state;");

  std::map<JobState, uint64_t> counts;
  int                          rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    if (auto state = jobq::model::ParseJobState(ColText(st.get(), 0))) {
      counts[*state] = static_cast<uint64_t>(ColI64(st.get(), 1));
    }
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return counts;
}

// ------------------------------------------------------------------
// Config
// ------------------------------------------------------------------

std::optional<model::ConfigRecord> SqliteRepository::GetConfig(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT key,value FROM config WHERE key=?;");
  BindText(st.get(), 1, key);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return model::ConfigRecord{ColText(st.get(), 0), ColText(st.get(), 1)};
}

Result SqliteRepository::PutConfig(Transaction& t, const model::ConfigRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "INSERT INTO config(key,value) VALUES(?,?) ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
  BindText(st.get(), 1, r.key);
  BindText(st.get(), 2, r.value);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ConfigRecord> SqliteRepository::ListConfig(Transaction& t) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, "SELECT key,value FROM config ORDER BY key;");

  std::vector<model::ConfigRecord> out;
  int                              rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back({ColText(st.get(), 0), ColText(st.get(), 1)});
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace jobq::db::sqlite
