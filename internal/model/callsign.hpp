#pragma once

#include <string>
#include <string_view>

namespace awacs::model {

/*
  Canonical form used to compare callsigns heard on the radio with pilot
  names from telemetry: lower case, alphanumerics only, spoken digits
  ("one" .. "niner") folded to digits.

    "Enfield 1-1"        -> "enfield11"
    "enfield one one"    -> "enfield11"
    "Overlord"           -> "overlord"
*/
std::string NormalizeCallsign(std::string_view callsign);

bool SameCallsign(std::string_view a, std::string_view b);

} // namespace awacs::model
