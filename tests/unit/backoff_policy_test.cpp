#include "internal/retry/backoff_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using jobq::model::JobState;
using jobq::retry::BackoffPolicy;
using std::chrono::seconds;

const jobq::util::TimePoint kNow = jobq::util::TimePoint{} + seconds(1700000000);

void TestExponentialDelay() {
  assert(BackoffPolicy::Delay(2, 1) == seconds(2));
  assert(BackoffPolicy::Delay(2, 2) == seconds(4));
  assert(BackoffPolicy::Delay(2, 3) == seconds(8));
  assert(BackoffPolicy::Delay(3, 2) == seconds(9));
  assert(BackoffPolicy::Delay(10, 0) == seconds(1));
}

void TestBaseOneIsConstant() {
  assert(BackoffPolicy::Delay(1, 1) == seconds(1));
  assert(BackoffPolicy::Delay(1, 50) == seconds(1));
}

void TestDelaySaturates() {
  assert(BackoffPolicy::Delay(2, 62) == jobq::retry::kMaxBackoffDelay);
  assert(BackoffPolicy::Delay(1000, 1000) == jobq::retry::kMaxBackoffDelay);
  assert(BackoffPolicy::Delay(2, 24) == seconds(16777216));
}

void TestFailureSequenceEndsDead() {
  // max_retries=3, base=2: delays 2, 4, 8, then DEAD
  int64_t attempts = 0;
  for (int64_t expected_delay : {2, 4, 8}) {
    auto outcome = BackoffPolicy::OnFailure(attempts, 3, 2, kNow, "Exit code 1");
    assert(outcome.state == JobState::kFailed);
    assert(outcome.attempts == attempts + 1);
    assert(outcome.next_retry_at.has_value());
    assert(*outcome.next_retry_at == kNow + seconds(expected_delay));
    assert(outcome.error_message == "Exit code 1");
    attempts = outcome.attempts;
  }

  auto dead = BackoffPolicy::OnFailure(attempts, 3, 2, kNow, "Exit code 1");
  assert(dead.state == JobState::kDead);
  assert(dead.attempts == 4);
  assert(!dead.next_retry_at.has_value());
}

void TestZeroRetriesGoesStraightToDead() {
  auto outcome = BackoffPolicy::OnFailure(0, 0, 2, kNow, "boom");
  assert(outcome.state == JobState::kDead);
  assert(outcome.attempts == 1);
  assert(!outcome.next_retry_at.has_value());
}

} // namespace

int main() {
  TestExponentialDelay();
  TestBaseOneIsConstant();
  TestDelaySaturates();
  TestFailureSequenceEndsDead();
  TestZeroRetriesGoesStraightToDead();

  std::cout << "jobq_unit_backoff_policy: pass\n";
  return 0;
}
