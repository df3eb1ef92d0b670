#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace jobq::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  std::vector<model::JobRecord> ListJobs(Transaction&, const JobFilter&) override;
  Result UpdateJob(Transaction&, const model::JobRecord&) override;
  Result DeleteJob(Transaction&, const std::string&) override;
  Result DeleteJobs(Transaction&, const JobFilter&, uint64_t& deleted) override;

  Result AgeWaitingJobs(Transaction&) override;
  std::optional<model::JobRecord> SelectNextClaimable(Transaction&, util::TimePoint now) override;
  Result MarkClaimed(Transaction&, const std::string& id, const std::string& worker_id, util::TimePoint now) override;
  std::map<jobq::model::JobState, uint64_t> CountByState(Transaction&) override;

  std::optional<model::ConfigRecord> GetConfig(Transaction&, const std::string&) override;
  Result PutConfig(Transaction&, const model::ConfigRecord&) override;
  std::vector<model::ConfigRecord> ListConfig(Transaction&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
