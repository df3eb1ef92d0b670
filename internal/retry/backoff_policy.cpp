#include "backoff_policy.hpp"

namespace jobq::retry {

std::chrono::seconds BackoffPolicy::Delay(int64_t backoff_base, int64_t attempts) {
  const int64_t cap = kMaxBackoffDelay.count();
  if (backoff_base <= 1 || attempts <= 0) {
    return std::chrono::seconds(1);
  }

  int64_t delay = 1;
  for (int64_t i = 0; i < attempts; ++i) {
    if (delay > cap / backoff_base) {
      return kMaxBackoffDelay;
    }
    delay *= backoff_base;
  }
  return std::chrono::seconds(delay > cap ? cap : delay);
}

FailureOutcome BackoffPolicy::OnFailure(int64_t attempts, int64_t max_retries, int64_t backoff_base, util::TimePoint now, std::string error_message) {
  FailureOutcome out;
  out.attempts      = attempts + 1;
  out.error_message = std::move(error_message);

  if (out.attempts > max_retries) {
    out.state = model::JobState::kDead;
    return out;
  }

  out.state         = model::JobState::kFailed;
  out.next_retry_at = now + Delay(backoff_base, out.attempts);
  return out;
}

} // namespace jobq::retry
