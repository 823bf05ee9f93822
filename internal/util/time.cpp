#include "time.hpp"

#include <cstdio>
#include <ctime>
#include <string>

namespace awacs::util {

TimePoint Now() {
  return Clock::now();
}

SteadyTime SteadyNow() {
  return SteadyClock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

Duration FromProto(const google::protobuf::Duration& d, Duration fallback) {
  if (d.seconds() == 0 && d.nanos() == 0) {
    return fallback;
  }
  return std::chrono::duration_cast<Duration>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

double ToSeconds(Clock::duration d) {
  return std::chrono::duration<double>(d).count();
}

bool ParseIso8601(const std::string& text, TimePoint* out) {
  int    year = 0, month = 0, day = 0, hour = 0, minute = 0;
  double second = 0.0;
  char   zone   = '\0';

  const int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%lf%c", &year, &month, &day, &hour, &minute, &second, &zone);
  if (fields < 6) {
    return false;
  }
  if (fields == 7 && zone != 'Z') {
    return false;
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second < 0.0 || second >= 61.0) {
    return false;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = 0;

  const std::time_t seconds = timegm(&tm);
  if (seconds == static_cast<std::time_t>(-1)) {
    return false;
  }

  *out = Clock::from_time_t(seconds) + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(second));
  return true;
}

} // namespace awacs::util
