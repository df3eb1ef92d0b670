#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace jobq::model {

enum class JobState : std::uint8_t {
  kPending    = 0,
  kProcessing = 1,
  kCompleted  = 2,
  kFailed     = 3,
  kDead       = 4,
};

// Persisted lowercase name ("pending", "processing", ...).
const char* ToString(JobState state);

std::optional<JobState> ParseJobState(std::string_view text);

} // namespace jobq::model
