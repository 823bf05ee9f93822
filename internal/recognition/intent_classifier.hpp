#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/model/radio.hpp"
#include "internal/model/request.hpp"
#include "internal/util/time.hpp"

namespace awacs::recognition {

// "<addressee>, <sender>, <request>" split out of a transcript.
struct Transmission {
  std::string addressee;
  std::string sender; // empty when the pilot did not say who they are
  std::string request;
};

/*
  Turns a transcript into a RadioRequest.

    Classify("Overlord, Enfield 1-1, bogey dope") -> BogeyDopeRequest from "Enfield 1-1"
    Classify("Magic, Enfield 1-1, bogey dope")    -> nullopt (not for us)
    Classify("Overlord, Enfield 1-1, tell a joke") -> throws util::UnrecognizedRequest
*/
class IntentClassifier {
 public:
  explicit IntentClassifier(std::string controller_callsign);

  std::optional<awacs::model::RadioRequest> Classify(std::string_view transcript, const awacs::model::PilotId& radio_identity,
                                                     util::SteadyTime transmission_start) const;

  // Callsign the reply should be addressed to when the request itself cannot be understood.
  std::string ReplyAddressee(std::string_view transcript, const awacs::model::PilotId& radio_identity) const;

  std::optional<Transmission> Split(std::string_view transcript) const;

  static awacs::model::RequestKind ParseRequest(std::string_view request);

 private:
  std::string callsign_;
  std::string normalized_callsign_;
};

} // namespace awacs::recognition
