#include "pg_repository.hpp"

#include <stdexcept>

#include "internal/scheduler/selection_policy.hpp"

namespace jobq::db::postgres {

using jobq::model::JobState;

namespace {

// Transaction-scoped advisory lock taken by every aging pass. Held until
// commit, so an enqueue's aging always sees the rows of earlier enqueues.
constexpr int64_t kAgingLockKey = 0x6a6f6271;

constexpr const char* kJobColumns =
    "id,command,state,attempts,max_retries,timeout,backoff_base,priority,waiting_time,"
    "created_at,updated_at,next_retry_at,error_message,output,execution_time,locked_by,locked_at";

std::optional<std::string> OptTime(const std::optional<util::TimePoint>& tp) {
  if (!tp) return std::nullopt;
  return util::ToIso8601(*tp);
}

std::optional<std::string> FieldOptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

std::optional<util::TimePoint> FieldOptTime(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return util::FromIso8601(f.c_str());
}

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.id      = row[0].c_str();
  r.command = row[1].c_str();

  auto state = jobq::model::ParseJobState(row[2].c_str());
  if (!state) {
    throw std::runtime_error("job " + r.id + " has unknown state '" + std::string(row[2].c_str()) + "'");
  }
  r.state = *state;

  r.attempts       = row[3].as<int64_t>();
  r.max_retries    = row[4].as<int64_t>();
  r.timeout        = row[5].as<int64_t>();
  r.backoff_base   = row[6].as<int64_t>();
  r.priority       = row[7].as<int64_t>();
  r.waiting_time   = row[8].as<int64_t>();
  r.created_at     = FieldOptTime(row[9]).value_or(util::TimePoint{});
  r.updated_at     = FieldOptTime(row[10]).value_or(util::TimePoint{});
  r.next_retry_at  = FieldOptTime(row[11]);
  r.error_message  = FieldOptText(row[12]);
  r.output         = FieldOptText(row[13]);
  r.execution_time = row[14].is_null() ? std::nullopt : std::optional<double>(row[14].as<double>());
  r.locked_by      = FieldOptText(row[15]);
  r.locked_at      = FieldOptTime(row[16]);
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

// MVCC: a plain transaction never blocks writers.
std::unique_ptr<db::Transaction> PgRepository::BeginRead() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_job", r.id, r.command, jobq::model::ToString(r.state), r.attempts, r.max_retries, r.timeout,
                                          r.backoff_base, r.priority, r.waiting_time, util::ToIso8601(r.created_at), util::ToIso8601(r.updated_at),
                                          OptTime(r.next_retry_at), r.error_message, r.output, r.execution_time, r.locked_by, OptTime(r.locked_at));
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::AlreadyExists, "job " + r.id + " already exists");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_job", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

std::vector<model::JobRecord> PgRepository::ListJobs(Transaction& t, const JobFilter& filter) {
  const std::string base = std::string("SELECT ") + kJobColumns + " FROM jobs";
  pqxx::result      res;
  if (filter.state) {
    res = TX(t).Work().exec_params(base + " WHERE state=$1 ORDER BY created_at DESC, id ASC;", std::string(jobq::model::ToString(*filter.state)));
  } else {
    res = TX(t).Work().exec(base + " ORDER BY created_at DESC, id ASC;");
  }

  std::vector<model::JobRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadJob(row));
  }
  return records;
}

Result PgRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_job", r.id, r.command, jobq::model::ToString(r.state), r.attempts, r.max_retries, r.timeout,
                                          r.backoff_base, r.priority, r.waiting_time, util::ToIso8601(r.created_at), util::ToIso8601(r.updated_at),
                                          OptTime(r.next_retry_at), r.error_message, r.output, r.execution_time, r.locked_by, OptTime(r.locked_at));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "job " + r.id + " not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteJob(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_job", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "job " + id + " not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteJobs(Transaction& t, const JobFilter& filter, uint64_t& deleted) {
  deleted = 0;
  try {
    pqxx::result res;
    if (filter.state) {
      res = TX(t).Work().exec_params("DELETE FROM jobs WHERE state=$1;", std::string(jobq::model::ToString(*filter.state)));
    } else {
      res = TX(t).Work().exec("DELETE FROM jobs;");
    }
    deleted = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::AgeWaitingJobs(Transaction& t) {
  try {
    TX(t).Work().exec_params("SELECT pg_advisory_xact_lock($1::bigint);", kAgingLockKey);
    TX(t).Work().exec("UPDATE jobs SET waiting_time=waiting_time+1 WHERE state IN ('pending','failed') AND locked_by IS NULL;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::SelectNextClaimable(Transaction& t, util::TimePoint now) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kJobColumns +
                                          " FROM jobs WHERE locked_by IS NULL"
                                          " AND (state='pending' OR (state='failed' AND next_retry_at IS NOT NULL AND next_retry_at <= $1))"
                                          " ORDER BY " +
                                          scheduler::kClaimOrderSql + " LIMIT 1 FOR UPDATE SKIP LOCKED;",
                                      util::ToIso8601(now));
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

Result PgRepository::MarkClaimed(Transaction& t, const std::string& id, const std::string& worker_id, util::TimePoint now) {
  try {
    auto res = TX(t).Work().exec_prepared("mark_claimed", id, worker_id, util::ToIso8601(now));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "job " + id + " is no longer claimable");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::map<JobState, uint64_t> PgRepository::CountByState(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT state, COUNT(*) FROM jobs GROUP BY state;");

  std::map<JobState, uint64_t> counts;
  for (const auto& row : res) {
    if (auto state = jobq::model::ParseJobState(row[0].c_str())) {
      counts[*state] = row[1].as<uint64_t>();
    }
  }
  return counts;
}

// ------------------------------------------------------------------
// Config
// ------------------------------------------------------------------

std::optional<model::ConfigRecord> PgRepository::GetConfig(Transaction& t, const std::string& key) {
  auto res = TX(t).Work().exec_params("SELECT key,value FROM config WHERE key=$1;", key);
  if (res.empty()) {
    return std::nullopt;
  }
  return model::ConfigRecord{res[0][0].c_str(), res[0][1].c_str()};
}

Result PgRepository::PutConfig(Transaction& t, const model::ConfigRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO config(key,value) VALUES($1,$2) ON CONFLICT(key) DO UPDATE SET value=EXCLUDED.value;", r.key, r.value);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ConfigRecord> PgRepository::ListConfig(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT key,value FROM config ORDER BY key;");

  std::vector<model::ConfigRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({row[0].c_str(), row[1].c_str()});
  }
  return out;
}

} // namespace jobq::db::postgres
