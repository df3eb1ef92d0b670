#include "time.hpp"

#include <ctime>
#include <cstdio>

namespace jobq::util {

TimePoint Now() {
  return TruncateToMicros(Clock::now());
}

TimePoint TruncateToMicros(TimePoint tp) {
  return std::chrono::time_point_cast<std::chrono::microseconds>(tp);
}

std::string ToIso8601(TimePoint tp) {
  const auto micros_since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();

  auto seconds = micros_since_epoch / 1000000;
  auto micros  = micros_since_epoch % 1000000;
  if (micros < 0) {
    micros += 1000000;
    seconds -= 1;
  }

  const std::time_t tt = static_cast<std::time_t>(seconds);
  std::tm           utc{};
  gmtime_r(&tt, &utc);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min,
                utc.tm_sec, static_cast<long long>(micros));
  return buf;
}

std::optional<TimePoint> FromIso8601(const std::string& text) {
  if (text.size() < 19) {
    return std::nullopt;
  }

  std::tm utc{};
  char    sep = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d", &utc.tm_year, &utc.tm_mon, &utc.tm_mday, &sep, &utc.tm_hour, &utc.tm_min, &utc.tm_sec) != 7) {
    return std::nullopt;
  }
  if (sep != 'T' && sep != ' ') {
    return std::nullopt;
  }
  utc.tm_year -= 1900;
  utc.tm_mon -= 1;

  long long micros = 0;
  if (text.size() > 19 && text[19] == '.') {
    int digits = 0;
    for (std::size_t i = 20; i < text.size() && digits < 6; ++i, ++digits) {
      const char c = text[i];
      if (c < '0' || c > '9') break;
      micros = micros * 10 + (c - '0');
    }
    for (; digits < 6; ++digits) micros *= 10;
  }

  const std::time_t seconds = timegm(&utc);
  return TimePoint{} + std::chrono::seconds(seconds) + std::chrono::microseconds(micros);
}

} // namespace jobq::util
