#include "internal/compose/phraseology.hpp"

#include <cmath>
#include <cstdio>
#include <variant>

#include "internal/compose/aircraft_names.hpp"
#include "internal/geometry/geometry.hpp"

namespace awacs::compose {

using awacs::model::Aspect;

Phraseology::Phraseology(std::string controller_callsign) : callsign_(std::move(controller_callsign)) {
}

std::string Phraseology::Script(std::string_view pilot, std::string_view message) const {
  std::string script;
  script.reserve(pilot.size() + callsign_.size() + message.size() + 4);
  script.append(pilot);
  script.append(", ");
  script.append(callsign_);
  script.append(", ");
  script.append(message);
  return script;
}

std::string Phraseology::Render(std::string_view pilot, const awacs::model::CallOutcome& outcome) const {
  struct Visitor {
    std::string operator()(const awacs::model::BogeyDopeCall& call) const {
      return BogeyDopeMessage(call.result);
    }
    std::string operator()(const awacs::model::CleanCall&) const {
      return "picture clean";
    }
    std::string operator()(const awacs::model::RadioCheckCall&) const {
      return "five by five";
    }
  };
  return Script(pilot, std::visit(Visitor{}, outcome));
}

std::string Phraseology::NoTrack(std::string_view pilot) const {
  return Script(pilot, "stand by, I cannot find you on scope");
}

std::string Phraseology::NotFriendly(std::string_view pilot) const {
  return Script(pilot, "you are not in my coalition");
}

std::string Phraseology::SayAgain(std::string_view pilot) const {
  return Script(pilot, "say again");
}

std::string Phraseology::SpokenBearing(int bearing_deg) {
  char digits[4];
  std::snprintf(digits, sizeof(digits), "%03d", ((bearing_deg % 360) + 360) % 360);
  std::string out;
  for (int i = 0; i < 3; ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    out.push_back(digits[i]);
  }
  return out;
}

std::string Phraseology::AltitudePhrase(int altitude_block) {
  if (altitude_block <= 0) {
    return "on the deck";
  }
  if (altitude_block == 1) {
    return "one thousand";
  }
  return std::to_string(altitude_block) + " thousand";
}

std::string_view Phraseology::CardinalPoint(double heading_deg) {
  static constexpr std::string_view kPoints[] = {"north", "north east", "east", "south east", "south", "south west", "west", "north west"};
  const auto sector = static_cast<int>(std::floor((geometry::NormalizeDeg(heading_deg) + 22.5) / 45.0)) % 8;
  return kPoints[sector];
}

std::string Phraseology::AspectPhrase(Aspect aspect, double target_heading_deg) {
  switch (aspect) {
    case Aspect::kHot:
      return "hot";
    case Aspect::kColocated:
      return "merged";
    case Aspect::kFlanking:
    case Aspect::kBeaming:
    case Aspect::kCold:
      return std::string(awacs::model::ToString(aspect)) + " " + std::string(CardinalPoint(target_heading_deg));
  }
  return "hot";
}

std::string Phraseology::BogeyDopeMessage(const awacs::model::CallResult& result) {
  std::string message = result.target_side == awacs::model::Side::kHostile ? "bandit" : "bogey";
  message += " bra " + SpokenBearing(result.bearing_deg);
  message += ", " + std::to_string(result.range_nm) + " miles";
  message += ", " + AltitudePhrase(result.altitude_block);
  message += ", " + AspectPhrase(result.aspect, result.target_heading_deg);

  const auto type = BrevityName(result.target_type);
  if (!type.empty()) {
    message += ", type ";
    message += type;
  }
  return message;
}

} // namespace awacs::compose
