#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/job_state.hpp"
#include "internal/util/time.hpp"

namespace jobq::db::model {

/*
  Persistent job row.

  IMPORTANT:
  - locked_by is set iff state == PROCESSING.
  - next_retry_at is set only while state == FAILED.
  - id never changes once inserted.
*/

struct JobRecord {
  std::string id;
  std::string command;

  jobq::model::JobState state = jobq::model::JobState::kPending;

  int64_t attempts     = 0;
  int64_t max_retries  = 0;
  int64_t timeout      = 0; // seconds
  int64_t backoff_base = 1;
  int64_t priority     = 0;

  // Anti-starvation accumulator, bumped once per later enqueue.
  int64_t waiting_time = 0;

  util::TimePoint created_at{};
  util::TimePoint updated_at{};

  std::optional<util::TimePoint> next_retry_at;
  std::optional<std::string>     error_message;
  std::optional<std::string>     output;
  std::optional<double>          execution_time;
  std::optional<std::string>     locked_by;
  std::optional<util::TimePoint> locked_at;
};

} // namespace jobq::db::model
