#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/config_record.hpp"
#include "internal/db/model/job_record.hpp"

namespace jobq::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a write Transaction (Begin)
  - Reads inside a transaction see its writes
  - SelectNextClaimable + MarkClaimed inside one write transaction is the
    atomic claim; MarkClaimed is additionally guarded by locked_by IS NULL
  - Read transactions (BeginRead) never block the writer

  The DB is the source of truth for:
    job state and locks
    engine defaults (config table)
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  // AlreadyExists when the id is taken.
  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  // Newest first (created_at DESC).
  virtual std::vector<model::JobRecord> ListJobs(Transaction&, const JobFilter&) = 0;

  // Full row overwrite keyed by id. NotFound when absent.
  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  virtual Result DeleteJob(Transaction&, const std::string& id) = 0;

  virtual Result DeleteJobs(Transaction&, const JobFilter&, uint64_t& deleted) = 0;

  // waiting_time += 1 for every unlocked PENDING/FAILED job. Concurrent
  // aging passes are serialized until commit, so none misses a job inserted
  // by an earlier writer.
  virtual Result AgeWaitingJobs(Transaction&) = 0;

  // Highest effective priority claimable job at `now`, see scheduler::kClaimOrderSql.
  virtual std::optional<model::JobRecord> SelectNextClaimable(Transaction&, util::TimePoint now) = 0;

  // Conditional PENDING/FAILED -> PROCESSING. Conflict when no unlocked
  // claimable row with that id exists.
  virtual Result MarkClaimed(Transaction&, const std::string& id, const std::string& worker_id, util::TimePoint now) = 0;

  virtual std::map<jobq::model::JobState, uint64_t> CountByState(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Config
  // ---------------------------------------------------------------------

  virtual std::optional<model::ConfigRecord> GetConfig(Transaction&, const std::string& key) = 0;

  // Upsert.
  virtual Result PutConfig(Transaction&, const model::ConfigRecord&) = 0;

  // Ordered by key.
  virtual std::vector<model::ConfigRecord> ListConfig(Transaction&) = 0;
};

} // namespace jobq::db
