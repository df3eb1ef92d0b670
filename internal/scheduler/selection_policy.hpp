#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/db/model/job_record.hpp"
#include "internal/util/time.hpp"

namespace jobq::scheduler {

// ORDER BY clause every SQL backend uses for the claim query. Must agree with Outranks().
inline constexpr const char* kClaimOrderSql = "(priority + waiting_time) DESC, created_at ASC, id ASC";

/*
  Stateless job selection.

  effective priority = priority + waiting_time; highest wins, then the oldest
  created_at, then the lowest id.
*/
class SelectionPolicy {
public:
  static int64_t EffectivePriority(const db::model::JobRecord& job);

  // True if `a` must be claimed before `b`.
  static bool Outranks(const db::model::JobRecord& a, const db::model::JobRecord& b);

  static bool IsClaimable(const db::model::JobRecord& job, util::TimePoint now);

  static std::optional<db::model::JobRecord> SelectNext(const std::vector<db::model::JobRecord>& jobs, util::TimePoint now);

  // SelectNext over any range of job records (e.g. the values of a map).
  template <typename Range>
  static std::optional<db::model::JobRecord> SelectNextIn(const Range& jobs, util::TimePoint now) {
    const db::model::JobRecord* best = nullptr;
    for (const db::model::JobRecord& job : jobs) {
      if (!IsClaimable(job, now)) continue;
      if (!best || Outranks(job, *best)) best = &job;
    }
    if (!best) return std::nullopt;
    return *best;
  }
};

} // namespace jobq::scheduler
