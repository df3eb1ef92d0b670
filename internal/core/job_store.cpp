#include "job_store.hpp"

#include <charconv>
#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/retry/backoff_policy.hpp"
#include "internal/util/errors.hpp"

namespace jobq::core {

using jobq::model::JobState;

namespace {

// A stale snapshot (memory), serialization failure (postgres) or busy lock (sqlite) is retried this many times.
constexpr int kMaxConflictRetries = 5;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

std::optional<int64_t> ParseInt(const std::string& text) {
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

void Validate(const db::model::JobRecord& job) {
  if (job.id.empty()) {
    throw util::ValidationError("job id must not be empty");
  }
  if (job.command.empty()) {
    throw util::ValidationError("job " + job.id + ": command must not be empty");
  }
  if (job.timeout <= 0) {
    throw util::ValidationError("job " + job.id + ": timeout must be > 0");
  }
  if (job.backoff_base < 1) {
    throw util::ValidationError("job " + job.id + ": backoff_base must be >= 1");
  }
  if (job.max_retries < 0) {
    throw util::ValidationError("job " + job.id + ": max_retries must be >= 0");
  }
}

db::model::JobRecord RequireProcessing(db::Repository& repo, db::Transaction& tx, const std::string& id, const char* op) {
  auto job = repo.GetJob(tx, id);
  if (!job) {
    throw util::NotFound(std::string(op) + ": job " + id + " not found");
  }
  if (job->state != JobState::kProcessing) {
    throw util::InvalidState(std::string(op) + ": job " + id + " is " + jobq::model::ToString(job->state) + ", not processing");
  }
  return *job;
}

} // namespace

JobStore::JobStore(std::shared_ptr<db::Repository> repository, ClockFn clock) : repository_(std::move(repository)), clock_(std::move(clock)) {
  if (!repository_) {
    throw std::invalid_argument("JobStore requires a repository");
  }
}

template <typename Fn>
auto JobStore::WithWriteTx(const char* op, Fn&& fn) {
  for (int attempt = 1;; ++attempt) {
    try {
      auto tx     = repository_->Begin();
      auto result = fn(*tx);
      tx->Commit();
      return result;
    } catch (const db::TransactionConflict& e) {
      if (attempt >= kMaxConflictRetries) {
        throw;
      }
      JOBQ_LOG_DEBUG("transaction conflict, retrying", {observability::StringField("op", op), observability::IntField("attempt", attempt)});
    }
  }
}

JobDefaults JobStore::ResolveDefaults(db::Transaction& tx) {
  JobDefaults defaults;
  auto        read = [&](const char* key, int64_t& out) {
    auto record = repository_->GetConfig(tx, key);
    if (!record) return;
    if (auto value = ParseInt(record->value)) {
      out = *value;
    } else {
      JOBQ_LOG_WARN("ignoring unparseable config value", {observability::StringField("key", key), observability::StringField("value", record->value)});
    }
  };
  read(kConfigMaxRetries, defaults.max_retries);
  read(kConfigTimeout, defaults.timeout);
  read(kConfigBackoffBase, defaults.backoff_base);
  read(kConfigPriority, defaults.priority);
  return defaults;
}

// ---------------------------------------------------------------------------
// Queue operations
// ---------------------------------------------------------------------------

db::model::JobRecord JobStore::Enqueue(const JobSpec& spec) {
  auto job = WithWriteTx("enqueue", [&](db::Transaction& tx) {
    const auto defaults = ResolveDefaults(tx);
    const auto now      = clock_();

    db::model::JobRecord record;
    record.id           = spec.id;
    record.command      = spec.command;
    record.state        = JobState::kPending;
    record.priority     = spec.priority.value_or(defaults.priority);
    record.max_retries  = spec.max_retries.value_or(defaults.max_retries);
    record.timeout      = spec.timeout.value_or(defaults.timeout);
    record.backoff_base = spec.backoff_base.value_or(defaults.backoff_base);
    record.created_at   = now;
    record.updated_at   = now;
    Validate(record);

    if (repository_->GetJob(tx, record.id)) {
      throw util::AlreadyExists("job " + record.id + " already exists");
    }

    // every job already waiting ages by one before the newcomer lands
    ThrowIfDbError(repository_->AgeWaitingJobs(tx), "age waiting jobs");
    ThrowIfDbError(repository_->InsertJob(tx, record), "enqueue job");
    return record;
  });

  JOBQ_LOG_INFO("job enqueued", {observability::StringField("job_id", job.id), observability::IntField("priority", job.priority),
                                 observability::IntField("max_retries", job.max_retries)});
  return job;
}

std::optional<db::model::JobRecord> JobStore::Claim(const std::string& worker_id) {
  if (worker_id.empty()) {
    throw std::invalid_argument("claim requires a worker id");
  }

  try {
    auto tx  = repository_->Begin();
    auto now = clock_();

    auto candidate = repository_->SelectNextClaimable(*tx, now);
    if (!candidate) {
      return std::nullopt;
    }

    auto result = repository_->MarkClaimed(*tx, candidate->id, worker_id, now);
    if (result.code == db::ErrorCode::Conflict) {
      // another claimer got there first
      return std::nullopt;
    }
    ThrowIfDbError(result, "claim job");
    tx->Commit();

    candidate->state      = JobState::kProcessing;
    candidate->locked_by  = worker_id;
    candidate->locked_at  = now;
    candidate->updated_at = now;
    candidate->next_retry_at.reset();
    return candidate;
  } catch (const db::TransactionConflict&) {
    return std::nullopt;
  }
}

db::model::JobRecord JobStore::SettleSuccess(const std::string& id, const std::string& output, double execution_time) {
  return WithWriteTx("settle_success", [&](db::Transaction& tx) {
    auto job = RequireProcessing(*repository_, tx, id, "settle success");

    job.state          = JobState::kCompleted;
    job.output         = output;
    job.execution_time = execution_time;
    job.updated_at     = clock_();
    job.next_retry_at.reset();
    job.locked_by.reset();
    job.locked_at.reset();

    ThrowIfDbError(repository_->UpdateJob(tx, job), "settle success");
    return job;
  });
}

db::model::JobRecord JobStore::SettleFailure(const std::string& id, const std::string& error_message, std::optional<double> execution_time) {
  return WithWriteTx("settle_failure", [&](db::Transaction& tx) {
    auto job = RequireProcessing(*repository_, tx, id, "settle failure");
    auto now = clock_();

    auto outcome = retry::BackoffPolicy::OnFailure(job.attempts, job.max_retries, job.backoff_base, now, error_message);

    job.state         = outcome.state;
    job.attempts      = outcome.attempts;
    job.next_retry_at = outcome.next_retry_at;
    job.error_message = outcome.error_message;
    job.updated_at    = now;
    if (execution_time) {
      job.execution_time = execution_time;
    }
    job.locked_by.reset();
    job.locked_at.reset();

    ThrowIfDbError(repository_->UpdateJob(tx, job), "settle failure");
    return job;
  });
}

bool JobStore::Remove(const std::string& id) {
  return WithWriteTx("remove", [&](db::Transaction& tx) {
    auto result = repository_->DeleteJob(tx, id);
    if (result.code == db::ErrorCode::NotFound) {
      return false;
    }
    ThrowIfDbError(result, "remove job");
    return true;
  });
}

uint64_t JobStore::Clear(std::optional<model::JobState> state) {
  return WithWriteTx("clear", [&](db::Transaction& tx) {
    uint64_t deleted = 0;
    ThrowIfDbError(repository_->DeleteJobs(tx, db::JobFilter{state}, deleted), "clear jobs");
    return deleted;
  });
}

std::optional<db::model::JobRecord> JobStore::Get(const std::string& id) {
  auto tx  = repository_->BeginRead();
  auto job = repository_->GetJob(*tx, id);
  tx->Commit();
  return job;
}

std::vector<db::model::JobRecord> JobStore::List(const db::JobFilter& filter) {
  auto tx   = repository_->BeginRead();
  auto jobs = repository_->ListJobs(*tx, filter);
  tx->Commit();
  return jobs;
}

StatusSummary JobStore::Status() {
  auto tx     = repository_->BeginRead();
  auto counts = repository_->CountByState(*tx);
  tx->Commit();

  StatusSummary summary;
  for (const auto& [state, count] : counts) {
    switch (state) {
      case JobState::kPending:
        summary.pending = count;
        break;
      case JobState::kProcessing:
        summary.processing = count;
        break;
      case JobState::kCompleted:
        summary.completed = count;
        break;
      case JobState::kFailed:
        summary.failed = count;
        break;
      case JobState::kDead:
        summary.dead = count;
        break;
    }
    summary.total += count;
  }
  return summary;
}

// ---------------------------------------------------------------------------
// Dead letter queue
// ---------------------------------------------------------------------------

std::vector<db::model::JobRecord> JobStore::ListDeadLetters() {
  return List(db::JobFilter{JobState::kDead});
}

bool JobStore::RetryDeadLetter(const std::string& id) {
  const bool retried = WithWriteTx("dlq_retry", [&](db::Transaction& tx) {
    auto job = repository_->GetJob(tx, id);
    if (!job || !jobq::model::CanTransition(job->state, JobState::kPending)) {
      return false;
    }

    job->state    = JobState::kPending;
    job->attempts = 0;
    job->error_message.reset();
    job->next_retry_at.reset();
    job->locked_by.reset();
    job->locked_at.reset();
    job->updated_at = clock_();

    ThrowIfDbError(repository_->UpdateJob(tx, *job), "retry dead letter");
    return true;
  });

  if (retried) {
    JOBQ_LOG_INFO("dead letter requeued", {observability::StringField("job_id", id)});
  }
  return retried;
}

uint64_t JobStore::ClearDeadLetters() {
  return Clear(JobState::kDead);
}

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

std::optional<std::string> JobStore::GetConfig(const std::string& key) {
  auto tx     = repository_->BeginRead();
  auto record = repository_->GetConfig(*tx, key);
  tx->Commit();
  if (!record) return std::nullopt;
  return record->value;
}

void JobStore::SetConfig(const std::string& key, const std::string& value) {
  if (key.empty()) {
    throw util::ValidationError("config key must not be empty");
  }
  WithWriteTx("set_config", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->PutConfig(tx, db::model::ConfigRecord{key, value}), "set config " + key);
    return true;
  });
}

std::vector<db::model::ConfigRecord> JobStore::ListConfig() {
  auto tx      = repository_->BeginRead();
  auto records = repository_->ListConfig(*tx);
  tx->Commit();
  return records;
}

void JobStore::SeedDefaults(const JobDefaults& defaults) {
  WithWriteTx("seed_defaults", [&](db::Transaction& tx) {
    auto seed = [&](const char* key, int64_t value) {
      if (repository_->GetConfig(tx, key)) return;
      ThrowIfDbError(repository_->PutConfig(tx, db::model::ConfigRecord{key, std::to_string(value)}), std::string("seed config ") + key);
    };
    seed(kConfigMaxRetries, defaults.max_retries);
    seed(kConfigBackoffBase, defaults.backoff_base);
    seed(kConfigTimeout, defaults.timeout);
    seed(kConfigPriority, defaults.priority);
    return true;
  });
}

} // namespace jobq::core
