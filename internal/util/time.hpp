#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace awacs::util {

/*
  Time utilities: single place to control clock sources.

  Two clocks are in play:
    - Clock (system): telemetry source timestamps, admin output.
    - SteadyClock: session deadlines and track staleness (receive time).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock = std::chrono::steady_clock;
using SteadyTime  = SteadyClock::time_point;

using Duration = std::chrono::milliseconds;

TimePoint  Now();
SteadyTime SteadyNow();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// Zero/unset protobuf durations resolve to the supplied fallback.
Duration FromProto(const google::protobuf::Duration& d, Duration fallback);

uint64_t ToUnixMillis(TimePoint tp);

double ToSeconds(Clock::duration d);

// Parses an ISO-8601 UTC timestamp ("2011-06-02T05:00:00Z", fractional seconds allowed).
bool ParseIso8601(const std::string& text, TimePoint* out);

} // namespace awacs::util
