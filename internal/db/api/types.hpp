#pragma once

#include <optional>

#include "internal/model/job_state.hpp"

namespace jobq::db {

// Filter for ListJobs / DeleteJobs. An empty filter matches every job.
struct JobFilter {
  std::optional<jobq::model::JobState> state;
};

} // namespace jobq::db
