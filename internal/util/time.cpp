#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace roipack::util {

namespace {

struct UtcFields {
  std::tm tm{};
  int     millis = 0;
};

UtcFields Split(TimePoint tp) {
  const auto    ms      = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  std::int64_t  seconds = ms / 1000;
  std::int64_t  rem     = ms % 1000;
  if (rem < 0) {
    rem += 1000;
    seconds -= 1;
  }

  UtcFields fields;
  const auto t = static_cast<std::time_t>(seconds);
  gmtime_r(&t, &fields.tm);
  fields.millis = static_cast<int>(rem);
  return fields;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string ToIso8601(TimePoint tp) {
  const auto f = Split(tp);
  char       buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", f.tm.tm_year + 1900, f.tm.tm_mon + 1, f.tm.tm_mday, f.tm.tm_hour,
                f.tm.tm_min, f.tm.tm_sec, f.millis);
  return buf;
}

std::string ToCalendarDate(TimePoint tp) {
  const auto f = Split(tp);
  char       buf[24];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", f.tm.tm_year + 1900, f.tm.tm_mon + 1, f.tm.tm_mday);
  return buf;
}

} // namespace roipack::util
