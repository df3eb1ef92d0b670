#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace jobq::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::vector<model::JobRecord> ListJobs(Transaction&, const JobFilter&) override;
  Result UpdateJob(Transaction&, const model::JobRecord&) override;
  Result DeleteJob(Transaction&, const std::string&) override;
  Result DeleteJobs(Transaction&, const JobFilter&, uint64_t& deleted) override;

  Result AgeWaitingJobs(Transaction&) override;
  // FOR UPDATE SKIP LOCKED: concurrent claimers each lock a different row.
  std::optional<model::JobRecord> SelectNextClaimable(Transaction&, util::TimePoint now) override;
  Result MarkClaimed(Transaction&, const std::string& id, const std::string& worker_id, util::TimePoint now) override;
  std::map<jobq::model::JobState, uint64_t> CountByState(Transaction&) override;

  std::optional<model::ConfigRecord> GetConfig(Transaction&, const std::string&) override;
  Result PutConfig(Transaction&, const model::ConfigRecord&) override;
  std::vector<model::ConfigRecord> ListConfig(Transaction&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
