#pragma once

#include <string_view>

namespace awacs::compose {

// NATO reporting / brevity name for a telemetry airframe name ("Su-27" -> "flanker").
// Unknown airframes are returned unchanged; an empty name stays empty.
std::string_view BrevityName(std::string_view airframe);

} // namespace awacs::compose
