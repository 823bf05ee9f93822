#pragma once

#include <string>
#include <string_view>

#include "internal/model/call_result.hpp"

namespace awacs::compose {

/*
  Fixed radio phraseology. Every script reads
  "<pilot>, <controller>, <message>".
*/
class Phraseology {
 public:
  explicit Phraseology(std::string controller_callsign);

  std::string Render(std::string_view pilot, const awacs::model::CallOutcome& outcome) const;

  std::string NoTrack(std::string_view pilot) const;
  std::string NotFriendly(std::string_view pilot) const;
  std::string SayAgain(std::string_view pilot) const;

  // "bandit bra 0 9 0, 60 miles, 15 thousand, cold west, type flanker"
  static std::string BogeyDopeMessage(const awacs::model::CallResult& result);

  static std::string      SpokenBearing(int bearing_deg);
  static std::string      AltitudePhrase(int altitude_block);
  static std::string_view CardinalPoint(double heading_deg);
  static std::string      AspectPhrase(awacs::model::Aspect aspect, double target_heading_deg);

  const std::string& controller_callsign() const {
    return callsign_;
  }

 private:
  std::string Script(std::string_view pilot, std::string_view message) const;

  std::string callsign_;
};

} // namespace awacs::compose
