#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace jobq::core {

// Config table keys holding the engine-wide job defaults.
inline constexpr const char* kConfigMaxRetries  = "max-retries";
inline constexpr const char* kConfigBackoffBase = "backoff-base";
inline constexpr const char* kConfigTimeout     = "timeout";
inline constexpr const char* kConfigPriority    = "priority";

struct JobDefaults {
  int64_t max_retries  = 3;
  int64_t timeout      = 20;
  int64_t backoff_base = 2;
  int64_t priority     = 5;
};

// Enqueue request. Unset optionals resolve from the config table.
struct JobSpec {
  std::string            id;
  std::string            command;
  std::optional<int64_t> priority;
  std::optional<int64_t> max_retries;
  std::optional<int64_t> timeout;
  std::optional<int64_t> backoff_base;
};

struct StatusSummary {
  uint64_t pending    = 0;
  uint64_t processing = 0;
  uint64_t completed  = 0;
  uint64_t failed     = 0;
  uint64_t dead       = 0;
  uint64_t total      = 0;
};

/*
  JobStore

  Owns every job mutation. Each public operation is one repository
  transaction; errors surface as jobq::util exceptions:

    AlreadyExists    enqueue with a taken id
    ValidationError  bad enqueue request
    NotFound         settle on an unknown id
    InvalidState     settle on a job that is not PROCESSING

  Claim never throws for contention: a lost race is "no job available".
*/
class JobStore {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit JobStore(std::shared_ptr<db::Repository> repository, ClockFn clock = util::Now);

  db::model::JobRecord Enqueue(const JobSpec& spec);

  std::optional<db::model::JobRecord> Claim(const std::string& worker_id);

  db::model::JobRecord SettleSuccess(const std::string& id, const std::string& output, double execution_time);
  db::model::JobRecord SettleFailure(const std::string& id, const std::string& error_message, std::optional<double> execution_time = std::nullopt);

  // False when the id does not exist.
  bool     Remove(const std::string& id);
  // Deletes all jobs, or only those in `state`. Returns the count removed.
  uint64_t Clear(std::optional<model::JobState> state = std::nullopt);

  std::optional<db::model::JobRecord> Get(const std::string& id);
  std::vector<db::model::JobRecord>   List(const db::JobFilter& filter = {});
  StatusSummary                       Status();

  // ---------------------------------------------------------------------
  // Dead letter queue
  // ---------------------------------------------------------------------

  std::vector<db::model::JobRecord> ListDeadLetters();
  // DEAD -> PENDING with attempts reset. False if the id is unknown or not DEAD.
  bool                              RetryDeadLetter(const std::string& id);
  uint64_t                          ClearDeadLetters();

  // ---------------------------------------------------------------------
  // Config
  // ---------------------------------------------------------------------

  std::optional<std::string>          GetConfig(const std::string& key);
  void                                SetConfig(const std::string& key, const std::string& value);
  std::vector<db::model::ConfigRecord> ListConfig();

  // Writes each default key that is not already present.
  void SeedDefaults(const JobDefaults& defaults);

 private:
  template <typename Fn>
  auto WithWriteTx(const char* op, Fn&& fn);

  JobDefaults ResolveDefaults(db::Transaction& tx);

  std::shared_ptr<db::Repository> repository_;
  ClockFn                         clock_;
};

} // namespace jobq::core
