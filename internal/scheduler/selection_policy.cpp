#include "selection_policy.hpp"

#include "internal/model/state_machine.hpp"

namespace jobq::scheduler {

using jobq::model::JobState;

int64_t SelectionPolicy::EffectivePriority(const db::model::JobRecord& job) {
  return job.priority + job.waiting_time;
}

bool SelectionPolicy::Outranks(const db::model::JobRecord& a, const db::model::JobRecord& b) {
  const auto pa = EffectivePriority(a);
  const auto pb = EffectivePriority(b);
  if (pa != pb) return pa > pb;
  if (a.created_at != b.created_at) return a.created_at < b.created_at;
  return a.id < b.id;
}

bool SelectionPolicy::IsClaimable(const db::model::JobRecord& job, util::TimePoint now) {
  if (!jobq::model::IsClaimable(job.state) || job.locked_by.has_value()) {
    return false;
  }
  if (job.state == JobState::kPending) {
    return true;
  }
  // a FAILED row without next_retry_at is not eligible, same as the SQL predicate
  return job.next_retry_at.has_value() && *job.next_retry_at <= now;
}

std::optional<db::model::JobRecord> SelectionPolicy::SelectNext(const std::vector<db::model::JobRecord>& jobs, util::TimePoint now) {
  return SelectNextIn(jobs, now);
}

} // namespace jobq::scheduler
