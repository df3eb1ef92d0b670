#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/job_state.hpp"
#include "internal/util/time.hpp"

namespace jobq::retry {

// Upper bound for a single backoff delay (one year).
inline constexpr std::chrono::seconds kMaxBackoffDelay{365LL * 24 * 3600};

struct FailureOutcome {
  model::JobState                state = model::JobState::kFailed;
  int64_t                        attempts = 0;
  std::optional<util::TimePoint> next_retry_at;
  std::string                    error_message;
};

/*
  Retry/backoff rules applied after a failed execution attempt:

    attempts' = attempts + 1
    attempts' >  max_retries -> DEAD, no next_retry_at
    attempts' <= max_retries -> FAILED, next_retry_at = now + base^attempts' seconds
*/
class BackoffPolicy {
public:
  // backoff_base ^ attempts seconds, saturating at kMaxBackoffDelay.
  static std::chrono::seconds Delay(int64_t backoff_base, int64_t attempts);

  static FailureOutcome OnFailure(int64_t attempts, int64_t max_retries, int64_t backoff_base, util::TimePoint now, std::string error_message);
};

} // namespace jobq::retry
