#pragma once

#include "internal/model/job_state.hpp"

namespace jobq::model {

constexpr bool IsTerminal(JobState state) {
  return state == JobState::kCompleted || state == JobState::kDead;
}

// States a worker may claim from (FAILED additionally needs next_retry_at <= now).
constexpr bool IsClaimable(JobState state) {
  return state == JobState::kPending || state == JobState::kFailed;
}

/*
  Job lifecycle:

    PENDING    -> PROCESSING   claim
    PROCESSING -> COMPLETED    success
    PROCESSING -> FAILED       failure, attempts <= max_retries
    PROCESSING -> DEAD         failure, attempts > max_retries
    FAILED     -> PROCESSING   claim after next_retry_at
    DEAD       -> PENDING      manual DLQ retry

  COMPLETED is terminal. DEAD only leaves through an operator retry.
*/
constexpr bool CanTransition(JobState from, JobState to) {
  switch (from) {
    case JobState::kPending:
      return to == JobState::kProcessing;
    case JobState::kProcessing:
      return to == JobState::kCompleted || to == JobState::kFailed || to == JobState::kDead;
    case JobState::kFailed:
      return to == JobState::kProcessing;
    case JobState::kDead:
      return to == JobState::kPending;
    case JobState::kCompleted:
      return false;
  }
  return false;
}

} // namespace jobq::model
