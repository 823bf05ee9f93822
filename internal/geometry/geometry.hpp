#pragma once

#include "internal/model/call_result.hpp"
#include "internal/model/position.hpp"

namespace awacs::geometry {

/*
  Relative-geometry kernel. Pure functions, no state.

  Convention:
    - range: haversine great-circle distance on a spherical Earth
      (R = 6 371 000 m), reported in nautical miles
    - bearing: initial great-circle bearing, degrees true, [0, 360)
    - aspect: target angle (target heading vs. bearing from target back
      to the observer) bucketed hot <= 25, flanking <= 65, beaming <= 115,
      cold otherwise
    - co-located (range < 1 m): bearing 0, aspect kColocated
*/

inline constexpr double kEarthRadiusM          = 6371000.0;
inline constexpr double kMetersPerNauticalMile = 1852.0;
inline constexpr double kFeetPerMeter          = 3.28084;
inline constexpr double kColocatedRangeM       = 1.0;

inline constexpr double kHotMaxDeg      = 25.0;
inline constexpr double kFlankingMaxDeg = 65.0;
inline constexpr double kBeamingMaxDeg  = 115.0;

struct Relation {
  double               bearing_deg{0.0};
  double               range_nm{0.0};
  double               altitude_delta_ft{0.0};
  awacs::model::Aspect aspect{awacs::model::Aspect::kColocated};
  bool                 colocated{true};
};

double RangeMeters(const awacs::model::Position& a, const awacs::model::Position& b);
double RangeNm(const awacs::model::Position& a, const awacs::model::Position& b);

// 0 when the two positions are co-located.
double BearingDeg(const awacs::model::Position& from, const awacs::model::Position& to);

double AltitudeDeltaFt(const awacs::model::Position& observer, const awacs::model::Position& target);

awacs::model::Aspect AspectOf(const awacs::model::Position& observer, const awacs::model::Position& target);

Relation Relate(const awacs::model::Position& observer, const awacs::model::Position& target);

// Smallest absolute difference between two headings, [0, 180].
double AngleDiffDeg(double a, double b);

double NormalizeDeg(double deg);

// ---------------- controller rounding ----------------

int RoundBearing(double bearing_deg);
int RoundRangeNm(double range_nm);
int AltitudeBlock(double altitude_m);

// Rounded relation of target to observer, as spoken in a bogey dope.
awacs::model::CallResult ToCallResult(const awacs::model::Position& observer, const awacs::model::Position& target);

} // namespace awacs::geometry
