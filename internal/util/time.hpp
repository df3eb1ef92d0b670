#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace jobq::util {

/*
  Time utilities — single place to control clock source and the persisted
  timestamp format.

  Timestamps persist as UTC ISO-8601 text with microseconds
  ("2024-05-01T12:30:00.000250") so lexical order equals chronological order.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Current time truncated to the persisted (microsecond) resolution.
TimePoint Now();

TimePoint TruncateToMicros(TimePoint tp);

std::string ToIso8601(TimePoint tp);

// Accepts the persisted format plus the fraction-less and space-separated
// forms ("2024-05-01T12:30:00", "2024-05-01 12:30:00").
std::optional<TimePoint> FromIso8601(const std::string& text);

} // namespace jobq::util
