#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include "internal/model/track.hpp"

namespace awacs::model {

enum class Aspect : std::uint8_t {
  kHot,
  kFlanking,
  kBeaming,
  kCold,
  kColocated,
};

constexpr std::string_view ToString(Aspect aspect) {
  switch (aspect) {
    case Aspect::kHot:
      return "hot";
    case Aspect::kFlanking:
      return "flanking";
    case Aspect::kBeaming:
      return "beaming";
    case Aspect::kCold:
      return "cold";
    case Aspect::kColocated:
      return "colocated";
  }
  return "colocated";
}

/*
  Rounded bogey-dope data for one contact, relative to the requester.
*/
struct CallResult {
  TrackId     target_id{0};
  int         bearing_deg{0};    // 0..350, multiple of 10
  int         range_nm{0};
  int         altitude_block{0}; // thousands of feet
  Aspect      aspect{Aspect::kColocated};
  double      target_heading_deg{0.0};
  Side        target_side{Side::kUnknown};
  std::string target_type;
};

struct BogeyDopeCall {
  CallResult result;
};

// No hostile or unknown contact within the search radius.
struct CleanCall {};

struct RadioCheckCall {};

using CallOutcome = std::variant<BogeyDopeCall, CleanCall, RadioCheckCall>;

} // namespace awacs::model
