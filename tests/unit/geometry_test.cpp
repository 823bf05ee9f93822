#include "internal/geometry/geometry.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

namespace {

using awacs::model::Aspect;
using awacs::model::Position;
namespace geo = awacs::geometry;

constexpr double kFeet = 1.0 / geo::kFeetPerMeter;

Position At(double lat, double lon, double altitude_ft = 0.0, double heading = 0.0) {
  Position p;
  p.latitude_deg  = lat;
  p.longitude_deg = lon;
  p.altitude_m    = altitude_ft * kFeet;
  p.heading_deg   = heading;
  return p;
}

void TestRegressionFixture() {
  const auto requester = At(0.0, 0.0, 10000.0, 90.0);

  auto hostile = At(0.0, 1.0, 15000.0, 90.0);
  auto result  = geo::ToCallResult(requester, hostile);
  assert(result.bearing_deg == 90);
  assert(result.range_nm == 60);
  assert(result.altitude_block == 15);
  assert(result.aspect == Aspect::kCold);

  hostile.heading_deg = 270.0;
  assert(geo::ToCallResult(requester, hostile).aspect == Aspect::kHot);

  hostile.heading_deg = 0.0;
  assert(geo::ToCallResult(requester, hostile).aspect == Aspect::kBeaming);

  hostile.heading_deg = 315.0;
  assert(geo::ToCallResult(requester, hostile).aspect == Aspect::kFlanking);

  const auto delta = geo::AltitudeDeltaFt(requester, hostile);
  assert(std::fabs(delta - 5000.0) < 1.0);
}

void TestColocatedPositions() {
  const auto a        = At(42.0, 41.5, 20000.0, 180.0);
  const auto relation = geo::Relate(a, a);
  assert(relation.colocated);
  assert(relation.range_nm == 0.0);
  assert(relation.bearing_deg == 0.0);
  assert(relation.aspect == Aspect::kColocated);
  assert(!std::isnan(geo::BearingDeg(a, a)));
}

void TestBearingIsReciprocalAndInRange() {
  const Position points[] = {At(0, 0), At(10, 10), At(-33.5, 151.2), At(42.1, 41.7), At(60, -170), At(-5, 179.5)};
  for (const auto& a : points) {
    for (const auto& b : points) {
      const auto bearing = geo::BearingDeg(a, b);
      assert(bearing >= 0.0 && bearing < 360.0);
      assert(geo::RangeNm(a, b) >= 0.0);
      if (geo::RangeMeters(a, b) < geo::kColocatedRangeM) {
        continue;
      }
      // Over short legs the reverse initial bearing is the reciprocal.
      if (geo::RangeNm(a, b) < 100.0) {
        const auto back = geo::BearingDeg(b, a);
        assert(std::fabs(geo::AngleDiffDeg(bearing, back) - 180.0) < 1.0);
      }
    }
  }

  const auto a = At(42.0, 41.0);
  const auto b = At(42.2, 41.1);
  assert(std::fabs(geo::AngleDiffDeg(geo::BearingDeg(a, b), geo::BearingDeg(b, a)) - 180.0) < 0.1);
}

void TestRoundingConventions() {
  assert(geo::RoundBearing(355.0) == 0);
  assert(geo::RoundBearing(4.9) == 0);
  assert(geo::RoundBearing(5.0) == 10);
  assert(geo::RoundBearing(89.0) == 90);
  assert(geo::RoundRangeNm(59.6) == 60);
  assert(geo::RoundRangeNm(0.2) == 0);
  assert(geo::AltitudeBlock(0.0) == 0);
  assert(geo::AltitudeBlock(-20.0) == 0);
  assert(geo::AltitudeBlock(24400.0 * kFeet) == 24);
  assert(geo::AltitudeBlock(24600.0 * kFeet) == 25);
}

void TestAngleHelpers() {
  assert(geo::NormalizeDeg(-90.0) == 270.0);
  assert(geo::NormalizeDeg(720.0) == 0.0);
  assert(geo::AngleDiffDeg(350.0, 10.0) == 20.0);
  assert(geo::AngleDiffDeg(0.0, 180.0) == 180.0);
}

void TestAspectBucketEdges() {
  // Observer due west of the target: bearing from target to observer is 270.
  const auto observer = At(0.0, 0.0);
  auto       target   = At(0.0, 0.5);

  target.heading_deg = 270.0 + geo::kHotMaxDeg - 0.5;
  assert(geo::AspectOf(observer, target) == Aspect::kHot);
  target.heading_deg = 270.0 + geo::kFlankingMaxDeg - 0.5;
  assert(geo::AspectOf(observer, target) == Aspect::kFlanking);
  target.heading_deg = 270.0 - geo::kBeamingMaxDeg + 0.5;
  assert(geo::AspectOf(observer, target) == Aspect::kBeaming);
  target.heading_deg = 270.0 - geo::kBeamingMaxDeg - 0.5;
  assert(geo::AspectOf(observer, target) == Aspect::kCold);
}

} // namespace

int main() {
  TestRegressionFixture();
  TestColocatedPositions();
  TestBearingIsReciprocalAndInRange();
  TestRoundingConventions();
  TestAngleHelpers();
  TestAspectBucketEdges();

  std::cout << "awacs_unit_geometry: pass\n";
  return 0;
}
