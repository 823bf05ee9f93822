#include "internal/compose/phraseology.hpp"

#include <cassert>
#include <iostream>

#include "internal/compose/aircraft_names.hpp"

namespace {

using awacs::compose::BrevityName;
using awacs::compose::Phraseology;
using awacs::model::Aspect;
using awacs::model::CallResult;
using awacs::model::Side;

CallResult Fixture() {
  CallResult result;
  result.target_id          = 2;
  result.bearing_deg        = 90;
  result.range_nm           = 60;
  result.altitude_block     = 15;
  result.aspect             = Aspect::kCold;
  result.target_heading_deg = 90.0;
  result.target_side        = Side::kHostile;
  result.target_type        = "MiG-29S";
  return result;
}

void TestBogeyDopeScript() {
  Phraseology phraseology("Overlord");
  const auto  script = phraseology.Render("Enfield 1-1", awacs::model::BogeyDopeCall{Fixture()});
  assert(script == "Enfield 1-1, Overlord, bandit bra 0 9 0, 60 miles, 15 thousand, cold east, type fulcrum");

  auto unknown        = Fixture();
  unknown.target_side = Side::kUnknown;
  unknown.target_type = "Mystery Jet";
  unknown.aspect      = Aspect::kHot;
  assert(Phraseology::BogeyDopeMessage(unknown) == "bogey bra 0 9 0, 60 miles, 15 thousand, hot, type Mystery Jet");

  unknown.target_type = "";
  assert(Phraseology::BogeyDopeMessage(unknown) == "bogey bra 0 9 0, 60 miles, 15 thousand, hot");
}

void TestFixedReplies() {
  Phraseology phraseology("Overlord");
  assert(phraseology.Render("Enfield 1-1", awacs::model::CleanCall{}) == "Enfield 1-1, Overlord, picture clean");
  assert(phraseology.Render("Enfield 1-1", awacs::model::RadioCheckCall{}) == "Enfield 1-1, Overlord, five by five");
  assert(phraseology.SayAgain("Enfield 1-1") == "Enfield 1-1, Overlord, say again");
  assert(phraseology.NoTrack("Enfield 1-1").rfind("Enfield 1-1, Overlord, ", 0) == 0);
  assert(phraseology.NotFriendly("Enfield 1-1") == "Enfield 1-1, Overlord, you are not in my coalition");
}

void TestNumbersAndDirections() {
  assert(Phraseology::SpokenBearing(0) == "0 0 0");
  assert(Phraseology::SpokenBearing(350) == "3 5 0");
  assert(Phraseology::SpokenBearing(360) == "0 0 0");

  assert(Phraseology::AltitudePhrase(0) == "on the deck");
  assert(Phraseology::AltitudePhrase(1) == "one thousand");
  assert(Phraseology::AltitudePhrase(32) == "32 thousand");

  assert(Phraseology::CardinalPoint(0.0) == "north");
  assert(Phraseology::CardinalPoint(22.4) == "north");
  assert(Phraseology::CardinalPoint(22.6) == "north east");
  assert(Phraseology::CardinalPoint(270.0) == "west");
  assert(Phraseology::CardinalPoint(-45.0) == "north west");
  assert(Phraseology::CardinalPoint(359.0) == "north");

  assert(Phraseology::AspectPhrase(Aspect::kHot, 45.0) == "hot");
  assert(Phraseology::AspectPhrase(Aspect::kBeaming, 180.0) == "beaming south");
  assert(Phraseology::AspectPhrase(Aspect::kFlanking, 315.0) == "flanking north west");
  assert(Phraseology::AspectPhrase(Aspect::kColocated, 0.0) == "merged");
}

void TestBrevityNames() {
  assert(BrevityName("Su-27") == "flanker");
  assert(BrevityName("F-16C_50") == "viper");
  assert(BrevityName("FA-18C_hornet") == "hornet");
  assert(BrevityName("Some Prototype") == "Some Prototype");
  assert(BrevityName("").empty());
}

} // namespace

int main() {
  TestBogeyDopeScript();
  TestFixedReplies();
  TestNumbersAndDirections();
  TestBrevityNames();

  std::cout << "awacs_unit_phraseology: pass\n";
  return 0;
}
