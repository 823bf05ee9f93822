#include "internal/recognition/intent_classifier.hpp"

#include <cassert>
#include <iostream>
#include <variant>

#include "internal/model/callsign.hpp"
#include "internal/util/errors.hpp"

namespace {

using awacs::model::BogeyDopeRequest;
using awacs::model::NormalizeCallsign;
using awacs::model::RadioCheckRequest;
using awacs::model::SameCallsign;
using awacs::recognition::IntentClassifier;

const auto kStart = awacs::util::SteadyTime{} + std::chrono::seconds(5);

void TestCallsignNormalization() {
  assert(NormalizeCallsign("Enfield 1-1") == "enfield11");
  assert(NormalizeCallsign("enfield one one") == "enfield11");
  assert(NormalizeCallsign("Springfield tree niner") == "springfield39");
  assert(NormalizeCallsign("  Overlord!") == "overlord");
  assert(NormalizeCallsign("--").empty());

  assert(SameCallsign("Dark Star", "darkstar"));
  assert(!SameCallsign("", ""));
  assert(!SameCallsign("Enfield 1-1", "Enfield 1-2"));
}

void TestFullTransmission() {
  IntentClassifier classifier("Overlord");

  auto request = classifier.Classify("Overlord, Enfield 1-1, bogey dope", "client-7", kStart);
  assert(request.has_value());
  assert(request->pilot == "Enfield 1-1");
  assert(std::holds_alternative<BogeyDopeRequest>(request->kind));
  assert(request->transmission_start == kStart);

  request = classifier.Classify("overlord, enfield one one, radio check.", "client-7", kStart);
  assert(request.has_value());
  assert(request->pilot == "enfield one one");
  assert(std::holds_alternative<RadioCheckRequest>(request->kind));
}

void TestSenderFallsBackToRadioIdentity() {
  IntentClassifier classifier("Overlord");

  auto request = classifier.Classify("Overlord, bogie dope", "Enfield 1-1", kStart);
  assert(request.has_value());
  assert(request->pilot == "Enfield 1-1");

  request = classifier.Classify("overlord bogey dope", "Enfield 1-1", kStart);
  assert(request.has_value());
  assert(request->pilot == "Enfield 1-1");
  assert(std::holds_alternative<BogeyDopeRequest>(request->kind));
}

void TestMultiWordControllerCallsign() {
  IntentClassifier classifier("Dark Star");

  auto split = classifier.Split("dark star comm check");
  assert(split.has_value());
  assert(split->addressee == "dark star");
  assert(split->request == "comm check");

  auto request = classifier.Classify("darkstar, Uzi 1-1, comms check", "client-1", kStart);
  assert(request.has_value());
  assert(std::holds_alternative<RadioCheckRequest>(request->kind));
}

void TestOtherAddresseeIsIgnored() {
  IntentClassifier classifier("Overlord");
  assert(!classifier.Classify("Magic, Enfield 1-1, bogey dope", "client-7", kStart).has_value());
  assert(!classifier.Classify("", "client-7", kStart).has_value());
  assert(!classifier.Classify(" , , ", "client-7", kStart).has_value());
}

void TestUnrecognizedRequestThrows() {
  IntentClassifier classifier("Overlord");

  bool threw = false;
  try {
    (void)classifier.Classify("Overlord, Enfield 1-1, tell a joke", "client-7", kStart);
  } catch (const awacs::util::UnrecognizedRequest&) {
    threw = true;
  }
  assert(threw);

  assert(classifier.ReplyAddressee("Overlord, Enfield 1-1, tell a joke", "client-7") == "Enfield 1-1");
  assert(classifier.ReplyAddressee("Overlord, tell a joke", "client-7") == "client-7");
}

void TestRequestPhrases() {
  assert(std::holds_alternative<BogeyDopeRequest>(IntentClassifier::ParseRequest("Requesting BOGEY DOPE")));
  assert(std::holds_alternative<BogeyDopeRequest>(IntentClassifier::ParseRequest("boogie-dope")));
  assert(std::holds_alternative<RadioCheckRequest>(IntentClassifier::ParseRequest("mic check, how copy")));
}

} // namespace

int main() {
  TestCallsignNormalization();
  TestFullTransmission();
  TestSenderFallsBackToRadioIdentity();
  TestMultiWordControllerCallsign();
  TestOtherAddresseeIsIgnored();
  TestUnrecognizedRequestThrows();
  TestRequestPhrases();

  std::cout << "awacs_unit_intent_classifier: pass\n";
  return 0;
}
