#include "internal/recognition/intent_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

#include "internal/model/callsign.hpp"
#include "internal/util/errors.hpp"

namespace awacs::recognition {

using awacs::model::BogeyDopeRequest;
using awacs::model::RadioCheckRequest;

namespace {

constexpr std::array<std::string_view, 6> kBogeyDopePhrases = {"bogey dope", "bogie dope", "boogie dope", "bogy dope", "bogeydope", "bogey doe"};
constexpr std::array<std::string_view, 4> kRadioCheckPhrases = {"radio check", "comm check", "comms check", "mic check"};

std::string Trim(std::string_view s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = s.find_last_not_of(" \t\r\n.!?");
  if (end == std::string_view::npos || end < begin) {
    return {};
  }
  return std::string(s.substr(begin, end - begin + 1));
}

// Lower case, punctuation folded to spaces, runs of spaces collapsed.
std::string Simplify(std::string_view s) {
  std::string out;
  bool        space = true;
  for (char c : s) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) {
      out.push_back(static_cast<char>(std::tolower(uc)));
      space = false;
    } else if (!space) {
      out.push_back(' ');
      space = true;
    }
  }
  if (!out.empty() && out.back() == ' ') {
    out.pop_back();
  }
  return out;
}

std::vector<std::string> SplitCommas(std::string_view transcript) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  while (start <= transcript.size()) {
    auto comma = transcript.find(',', start);
    if (comma == std::string_view::npos) {
      comma = transcript.size();
    }
    auto part = Trim(transcript.substr(start, comma - start));
    if (!part.empty()) {
      parts.push_back(std::move(part));
    }
    start = comma + 1;
  }
  return parts;
}

} // namespace

IntentClassifier::IntentClassifier(std::string controller_callsign)
    : callsign_(std::move(controller_callsign)), normalized_callsign_(awacs::model::NormalizeCallsign(callsign_)) {
}

std::optional<Transmission> IntentClassifier::Split(std::string_view transcript) const {
  const auto parts = SplitCommas(transcript);
  if (parts.empty()) {
    return std::nullopt;
  }

  Transmission transmission;
  if (parts.size() >= 3) {
    transmission.addressee = parts[0];
    transmission.sender    = parts[1];
    for (std::size_t i = 2; i < parts.size(); ++i) {
      if (!transmission.request.empty()) {
        transmission.request += ", ";
      }
      transmission.request += parts[i];
    }
    return transmission;
  }

  if (parts.size() == 2) {
    transmission.addressee = parts[0];
    transmission.request   = parts[1];
    return transmission;
  }

  // No commas: "overlord bogey dope". Peel the controller callsign off the front.
  const auto simplified = Simplify(parts[0]);
  std::string prefix;
  std::size_t pos = 0;
  while (pos < simplified.size()) {
    auto next = simplified.find(' ', pos);
    if (next == std::string::npos) {
      next = simplified.size();
    }
    prefix += simplified.substr(pos, next - pos) + " ";
    pos = next + 1;
    if (awacs::model::NormalizeCallsign(prefix) == normalized_callsign_) {
      transmission.addressee = Trim(prefix);
      transmission.request   = pos < simplified.size() ? simplified.substr(pos) : std::string();
      return transmission;
    }
  }

  transmission.request = parts[0];
  return transmission;
}

awacs::model::RequestKind IntentClassifier::ParseRequest(std::string_view request) {
  const auto text = Simplify(request);

  auto contains = [&](std::string_view phrase) { return text.find(phrase) != std::string::npos; };

  if (std::any_of(kBogeyDopePhrases.begin(), kBogeyDopePhrases.end(), contains)) {
    return BogeyDopeRequest{};
  }
  if (std::any_of(kRadioCheckPhrases.begin(), kRadioCheckPhrases.end(), contains)) {
    return RadioCheckRequest{};
  }
  throw util::UnrecognizedRequest("unrecognized request '" + std::string(request) + "'");
}

std::optional<awacs::model::RadioRequest> IntentClassifier::Classify(std::string_view transcript, const awacs::model::PilotId& radio_identity,
                                                                     util::SteadyTime transmission_start) const {
  auto transmission = Split(transcript);
  if (!transmission || awacs::model::NormalizeCallsign(transmission->addressee) != normalized_callsign_) {
    return std::nullopt;
  }

  awacs::model::RadioRequest request;
  request.pilot              = transmission->sender.empty() ? radio_identity : transmission->sender;
  request.kind               = ParseRequest(transmission->request);
  request.transmission_start = transmission_start;
  return request;
}

std::string IntentClassifier::ReplyAddressee(std::string_view transcript, const awacs::model::PilotId& radio_identity) const {
  auto transmission = Split(transcript);
  if (transmission && !transmission->sender.empty()) {
    return transmission->sender;
  }
  return radio_identity;
}

} // namespace awacs::recognition
