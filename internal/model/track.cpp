#include "internal/model/track.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numbers>

namespace awacs::model {

namespace {
constexpr double kEarthRadiusM = 6371000.0;
}

Position AircraftTrack::PositionAt(util::TimePoint t, util::Duration max_extrapolation) const {
  if (t <= timestamp) {
    return position;
  }

  const double elapsed = std::min(std::chrono::duration<double>(t - timestamp).count(), std::chrono::duration<double>(max_extrapolation).count());
  if (elapsed <= 0.0) {
    return position;
  }

  const double lat_rad = position.latitude_deg * std::numbers::pi / 180.0;
  const double cos_lat = std::cos(lat_rad);

  Position out = position;
  out.latitude_deg += (velocity_north_mps * elapsed / kEarthRadiusM) * 180.0 / std::numbers::pi;
  if (std::abs(cos_lat) > 1e-9) {
    out.longitude_deg += (velocity_east_mps * elapsed / (kEarthRadiusM * cos_lat)) * 180.0 / std::numbers::pi;
  }
  out.latitude_deg  = std::clamp(out.latitude_deg, -90.0, 90.0);
  out.longitude_deg = std::remainder(out.longitude_deg, 360.0);
  return out;
}

} // namespace awacs::model
