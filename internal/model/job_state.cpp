#include "job_state.hpp"

namespace jobq::model {

const char* ToString(JobState state) {
  switch (state) {
    case JobState::kPending:
      return "pending";
    case JobState::kProcessing:
      return "processing";
    case JobState::kCompleted:
      return "completed";
    case JobState::kFailed:
      return "failed";
    case JobState::kDead:
      return "dead";
  }
  return "unknown";
}

std::optional<JobState> ParseJobState(std::string_view text) {
  if (text == "pending") return JobState::kPending;
  if (text == "processing") return JobState::kProcessing;
  if (text == "completed") return JobState::kCompleted;
  if (text == "failed") return JobState::kFailed;
  if (text == "dead") return JobState::kDead;
  return std::nullopt;
}

} // namespace jobq::model
