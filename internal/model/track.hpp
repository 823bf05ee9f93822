#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/position.hpp"
#include "internal/util/time.hpp"

namespace awacs::model {

using TrackId = std::uint64_t;

enum class Side : std::uint8_t {
  kUnknown  = 0,
  kFriendly = 1,
  kHostile  = 2,
};

// Coalition the controller serves.
enum class Coalition : std::uint8_t {
  kBlue = 1,
  kRed  = 2,
};

constexpr std::string_view ToString(Side side) {
  switch (side) {
    case Side::kFriendly:
      return "friendly";
    case Side::kHostile:
      return "hostile";
    case Side::kUnknown:
      return "unknown";
  }
  return "unknown";
}

constexpr std::string_view ToString(Coalition coalition) {
  return coalition == Coalition::kBlue ? "blue" : "red";
}

/*
  Last known state of one aircraft.

  timestamp is the feed's source time and orders updates (never regresses);
  last_seen is local monotonic receive time and drives staleness eviction.
*/
struct AircraftTrack {
  TrackId     id{0};
  Side        side{Side::kUnknown};
  std::string pilot;
  std::string type_name;
  Position    position;

  util::TimePoint  timestamp{};
  util::SteadyTime last_seen{};

  // Derived velocity, m/s.
  double velocity_north_mps{0.0};
  double velocity_east_mps{0.0};

  // Dead-reckoned position at source time t, extrapolating at most max_extrapolation.
  Position PositionAt(util::TimePoint t, util::Duration max_extrapolation) const;
};

} // namespace awacs::model
