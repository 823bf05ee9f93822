#pragma once

#include <string>
#include <string_view>
#include <variant>

#include "internal/util/time.hpp"

namespace awacs::model {

struct BogeyDopeRequest {};

struct RadioCheckRequest {};

// Closed set of request kinds. Handled with std::visit so a new kind
// fails to compile until every consumer covers it.
using RequestKind = std::variant<BogeyDopeRequest, RadioCheckRequest>;

struct RadioRequest {
  // Callsign of the requester as spoken (or the radio identity when none was spoken).
  std::string      pilot;
  RequestKind      kind;
  util::SteadyTime transmission_start{};
};

inline std::string_view ToString(const RequestKind& kind) {
  struct Visitor {
    std::string_view operator()(const BogeyDopeRequest&) const {
      return "bogey_dope";
    }
    std::string_view operator()(const RadioCheckRequest&) const {
      return "radio_check";
    }
  };
  return std::visit(Visitor{}, kind);
}

} // namespace awacs::model
