#pragma once

namespace awacs::model {

/*
  Immutable kinematic snapshot of one aircraft.

  Latitude/longitude in degrees (WGS-84), altitude in meters MSL,
  heading in degrees true, ground speed in m/s.
*/
struct Position {
  double latitude_deg{0.0};
  double longitude_deg{0.0};
  double altitude_m{0.0};
  double heading_deg{0.0};
  double ground_speed_mps{0.0};
};

} // namespace awacs::model
