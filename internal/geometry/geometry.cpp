#include "internal/geometry/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace awacs::geometry {

using awacs::model::Aspect;
using awacs::model::Position;

namespace {

constexpr double ToRadians(double deg) {
  return deg * std::numbers::pi / 180.0;
}

constexpr double ToDegrees(double rad) {
  return rad * 180.0 / std::numbers::pi;
}

} // namespace

double NormalizeDeg(double deg) {
  double out = std::fmod(deg, 360.0);
  if (out < 0.0) {
    out += 360.0;
  }
  // fmod of a value just below 0 can round back up to 360.
  return out >= 360.0 ? 0.0 : out;
}

double AngleDiffDeg(double a, double b) {
  const double diff = std::fabs(NormalizeDeg(a) - NormalizeDeg(b));
  return diff > 180.0 ? 360.0 - diff : diff;
}

double RangeMeters(const Position& a, const Position& b) {
  const double lat1 = ToRadians(a.latitude_deg);
  const double lat2 = ToRadians(b.latitude_deg);
  const double dlat = lat2 - lat1;
  const double dlon = ToRadians(b.longitude_deg - a.longitude_deg);

  const double sin_dlat = std::sin(dlat / 2.0);
  const double sin_dlon = std::sin(dlon / 2.0);

  double h = sin_dlat * sin_dlat + std::cos(lat1) * std::cos(lat2) * sin_dlon * sin_dlon;
  h        = std::clamp(h, 0.0, 1.0);
  return 2.0 * kEarthRadiusM * std::asin(std::sqrt(h));
}

double RangeNm(const Position& a, const Position& b) {
  return RangeMeters(a, b) / kMetersPerNauticalMile;
}

double BearingDeg(const Position& from, const Position& to) {
  if (RangeMeters(from, to) < kColocatedRangeM) {
    return 0.0;
  }

  const double lat1 = ToRadians(from.latitude_deg);
  const double lat2 = ToRadians(to.latitude_deg);
  const double dlon = ToRadians(to.longitude_deg - from.longitude_deg);

  const double y = std::sin(dlon) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
  return NormalizeDeg(ToDegrees(std::atan2(y, x)));
}

double AltitudeDeltaFt(const Position& observer, const Position& target) {
  return (target.altitude_m - observer.altitude_m) * kFeetPerMeter;
}

Aspect AspectOf(const Position& observer, const Position& target) {
  if (RangeMeters(observer, target) < kColocatedRangeM) {
    return Aspect::kColocated;
  }

  const double target_angle = AngleDiffDeg(target.heading_deg, BearingDeg(target, observer));
  if (target_angle <= kHotMaxDeg) {
    return Aspect::kHot;
  }
  if (target_angle <= kFlankingMaxDeg) {
    return Aspect::kFlanking;
  }
  if (target_angle <= kBeamingMaxDeg) {
    return Aspect::kBeaming;
  }
  return Aspect::kCold;
}

Relation Relate(const Position& observer, const Position& target) {
  Relation relation;
  const double range_m       = RangeMeters(observer, target);
  relation.altitude_delta_ft = AltitudeDeltaFt(observer, target);
  relation.range_nm          = range_m / kMetersPerNauticalMile;
  relation.colocated         = range_m < kColocatedRangeM;
  if (relation.colocated) {
    return relation;
  }
  relation.bearing_deg = BearingDeg(observer, target);
  relation.aspect      = AspectOf(observer, target);
  return relation;
}

int RoundBearing(double bearing_deg) {
  const int rounded = static_cast<int>(std::lround(NormalizeDeg(bearing_deg) / 10.0)) * 10;
  return rounded % 360;
}

int RoundRangeNm(double range_nm) {
  return static_cast<int>(std::lround(std::max(range_nm, 0.0)));
}

int AltitudeBlock(double altitude_m) {
  return static_cast<int>(std::lround(std::max(altitude_m, 0.0) * kFeetPerMeter / 1000.0));
}

awacs::model::CallResult ToCallResult(const Position& observer, const Position& target) {
  const auto relation = Relate(observer, target);

  awacs::model::CallResult result;
  result.bearing_deg        = RoundBearing(relation.bearing_deg);
  result.range_nm           = RoundRangeNm(relation.range_nm);
  result.altitude_block     = AltitudeBlock(target.altitude_m);
  result.aspect             = relation.aspect;
  result.target_heading_deg = NormalizeDeg(target.heading_deg);
  return result;
}

} // namespace awacs::geometry
