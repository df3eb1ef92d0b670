#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace jobq::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::JobRecord> jobs;
    std::map<std::string, std::string>      config;
  };

  std::mutex mutex_;
  // held by the open write transaction, if any
  std::mutex writer_mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
