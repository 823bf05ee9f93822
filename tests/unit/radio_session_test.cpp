#include "internal/session/radio_session.hpp"

#include <cassert>
#include <iostream>
#include <variant>

#include "internal/util/errors.hpp"

namespace {

using awacs::session::AbortReason;
using awacs::session::BeginComposition;
using awacs::session::BeginSynthesis;
using awacs::session::BeginTranscription;
using awacs::session::BeginTransmission;
using awacs::session::CancelPending;
using awacs::session::Effects;
using awacs::session::QueueSayAgain;
using awacs::session::RadioSession;
using awacs::session::ReleaseChannel;
using awacs::session::RequestChannel;
using awacs::session::SessionState;
using awacs::session::SessionTimeouts;
using awacs::speech::SynthesisResult;
using awacs::speech::TranscriptionResult;
using namespace std::chrono_literals;

constexpr awacs::model::Frequency kFreq = 251000000;

const auto kT0 = awacs::util::SteadyTime{} + 1h;

template <typename T>
T Only(const Effects& effects) {
  assert(effects.size() == 1);
  return std::get<T>(effects.front());
}

template <typename T>
bool Has(const Effects& effects) {
  for (const auto& effect : effects) {
    if (std::holds_alternative<T>(effect)) {
      return true;
    }
  }
  return false;
}

awacs::model::AudioFrame Frame(std::uint8_t value) {
  return awacs::model::AudioFrame(8, value);
}

// Drives a fresh session to Transcribing with two frames; returns the op.
awacs::session::OpId Receive(RadioSession& session) {
  session.OnTransmissionStarted(kT0);
  session.OnAudio(Frame(1), kT0 + 100ms);
  session.OnAudio(Frame(2), kT0 + 200ms);
  const auto& begin = Only<BeginTranscription>(session.OnTransmissionEnded(kT0 + 1s));
  assert(begin.audio.size() == 2);
  assert(begin.attempt == 1);
  return begin.op;
}

void TestHappyPath() {
  RadioSession session(1, "Enfield 1-1", kFreq, SessionTimeouts{});
  assert(session.state() == SessionState::kIdle);
  assert(!session.deadline());

  const auto transcribe = Receive(session);
  assert(session.state() == SessionState::kTranscribing);
  assert(*session.deadline() == kT0 + 1s + 15s);
  assert(*session.transmission_ended_at() == kT0 + 1s);

  const auto& compose =
      Only<BeginComposition>(session.OnTranscription(transcribe, TranscriptionResult::Success("Overlord, Enfield 1-1, bogey dope"), kT0 + 2s));
  assert(compose.transcript == "Overlord, Enfield 1-1, bogey dope");
  assert(session.state() == SessionState::kComposing);

  const auto& synth = Only<BeginSynthesis>(session.OnComposed(compose.op, std::string("Enfield 1-1, Overlord, picture clean"), kT0 + 3s));
  assert(session.state() == SessionState::kSynthesizing);

  Only<RequestChannel>(session.OnSynthesis(synth.op, SynthesisResult::Success({Frame(9), Frame(9)}), kT0 + 4s));
  assert(session.state() == SessionState::kAwaitingChannel);

  const auto& transmit = Only<BeginTransmission>(session.OnChannelGranted(kT0 + 5s));
  assert(transmit.audio.size() == 2);
  assert(session.state() == SessionState::kTransmitting);

  Only<ReleaseChannel>(session.OnTransmitted(transmit.op, {true, {}}, kT0 + 8s));
  assert(session.state() == SessionState::kIdle);
  assert(session.completed() && session.replied() && session.finished());
  assert(!session.deadline());
}

void TestSilenceAndBlankTranscriptComplete() {
  RadioSession empty(1, "Enfield 1-1", kFreq, SessionTimeouts{});
  empty.OnTransmissionStarted(kT0);
  assert(empty.OnTransmissionEnded(kT0 + 1s).empty());
  assert(empty.completed() && !empty.replied());

  RadioSession blank(2, "Enfield 1-1", kFreq, SessionTimeouts{});
  const auto   op = Receive(blank);
  assert(blank.OnTranscription(op, TranscriptionResult::Success("  \n"), kT0 + 2s).empty());
  assert(blank.completed() && !blank.replied());

  RadioSession other(3, "Enfield 1-1", kFreq, SessionTimeouts{});
  const auto   transcribe = Receive(other);
  const auto&  compose    = Only<BeginComposition>(other.OnTranscription(transcribe, TranscriptionResult::Success("Magic, radio check"), kT0 + 2s));
  assert(other.OnComposed(compose.op, std::nullopt, kT0 + 3s).empty());
  assert(other.completed() && !other.replied());
}

void TestTranscriptionRetriesThenSaysAgain() {
  RadioSession session(1, "Enfield 1-1", kFreq, SessionTimeouts{});
  const auto   first = Receive(session);

  const auto& retry = Only<BeginTranscription>(session.OnTranscription(first, TranscriptionResult::Failure("503"), kT0 + 2s));
  assert(retry.op != first);
  assert(retry.attempt == 2);
  assert(retry.audio.size() == 2);
  assert(session.transcription_attempt() == 2);

  // Late completion of the first attempt is ignored.
  assert(session.OnTranscription(first, TranscriptionResult::Success("late"), kT0 + 3s).empty());
  assert(session.state() == SessionState::kTranscribing);

  const auto effects = session.OnTranscription(retry.op, TranscriptionResult::Failure("503"), kT0 + 4s);
  assert(session.state() == SessionState::kAborted);
  assert(session.abort_reason() == AbortReason::kCollaboratorFailure);
  assert(Has<QueueSayAgain>(effects));
}

void TestDeadlinesAbort() {
  RadioSession transcribing(1, "Enfield 1-1", kFreq, SessionTimeouts{});
  const auto   op = Receive(transcribing);
  assert(transcribing.OnTick(kT0 + 15s).empty());
  const auto timed_out = transcribing.OnTick(kT0 + 16s);
  assert(transcribing.abort_reason() == AbortReason::kTimeout);
  assert(Has<CancelPending>(timed_out) && Has<QueueSayAgain>(timed_out));
  assert(std::get<CancelPending>(timed_out.front()).op == op);

  // Nothing routes into an aborted session.
  assert(!transcribing.Accepts(awacs::model::TransmissionStarted{"Enfield 1-1", kFreq, kT0 + 17s}));
  assert(transcribing.OnTranscription(op, TranscriptionResult::Success("late"), kT0 + 17s).empty());
  assert(transcribing.OnTick(kT0 + 1h).empty());

  SessionTimeouts short_wait;
  short_wait.channel_wait_timeout = 2s;
  RadioSession waiting(2, "Enfield 1-1", kFreq, short_wait);
  const auto&  synth = Only<BeginSynthesis>(waiting.StartReply("Enfield 1-1, Overlord, say again", kT0));
  waiting.OnSynthesis(synth.op, SynthesisResult::Success({Frame(1)}), kT0 + 1s);
  const auto busy = waiting.OnTick(kT0 + 3s);
  assert(waiting.abort_reason() == AbortReason::kChannelBusy);
  assert(Has<ReleaseChannel>(busy));

  RadioSession receiving(3, "Enfield 1-1", kFreq, SessionTimeouts{});
  receiving.OnTransmissionStarted(kT0);
  receiving.OnTick(kT0 + 21s);
  assert(receiving.abort_reason() == AbortReason::kTimeout);
  assert(receiving.finished());
}

void TestFailuresAbort() {
  RadioSession synth_fail(1, "Enfield 1-1", kFreq, SessionTimeouts{});
  const auto&  synth = Only<BeginSynthesis>(synth_fail.StartReply("script", kT0));
  assert(synth_fail.OnSynthesis(synth.op, SynthesisResult::Success({}), kT0 + 1s).empty());
  assert(synth_fail.abort_reason() == AbortReason::kCollaboratorFailure);

  RadioSession tx_fail(2, "Enfield 1-1", kFreq, SessionTimeouts{});
  const auto&  tx_synth = Only<BeginSynthesis>(tx_fail.StartReply("script", kT0));
  tx_fail.OnSynthesis(tx_synth.op, SynthesisResult::Success({Frame(1)}), kT0 + 1s);
  const auto& transmit = Only<BeginTransmission>(tx_fail.OnChannelGranted(kT0 + 2s));
  const auto  aborted  = tx_fail.OnTransmitted(transmit.op, {false, "socket closed"}, kT0 + 3s);
  assert(tx_fail.abort_reason() == AbortReason::kTransportError);
  assert(Has<ReleaseChannel>(aborted));
  assert(!tx_fail.replied());

  RadioSession compose_fail(3, "Enfield 1-1", kFreq, SessionTimeouts{});
  const auto   transcribe = Receive(compose_fail);
  const auto&  compose    = Only<BeginComposition>(compose_fail.OnTranscription(transcribe, TranscriptionResult::Success("x"), kT0 + 2s));
  compose_fail.OnCompositionFailed(compose.op, kT0 + 3s);
  assert(compose_fail.abort_reason() == AbortReason::kInternalError);
}

void TestRadioInputRules() {
  RadioSession session(1, "Enfield 1-1", kFreq, SessionTimeouts{});
  assert(session.Accepts(awacs::model::TransmissionStarted{"Enfield 1-1", kFreq, kT0}));
  assert(!session.Accepts(awacs::model::TransmissionStarted{"Enfield 1-1", kFreq + 1, kT0}));
  assert(!session.Accepts(awacs::model::AudioReceived{"Enfield 1-1", kFreq, Frame(1), kT0}));

  bool threw = false;
  try {
    session.OnAudio(Frame(1), kT0);
  } catch (const awacs::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  Receive(session);
  assert(!session.Accepts(awacs::model::TransmissionStarted{"Enfield 1-1", kFreq, kT0 + 2s}));
  assert(session.Accepts(awacs::model::PilotDisconnected{"Enfield 1-1", 0, kT0 + 2s}));

  const auto effects = session.OnDisconnected(kT0 + 2s);
  assert(Has<CancelPending>(effects));
  assert(session.abort_reason() == AbortReason::kDisconnected);

  RadioSession idle(2, "Enfield 1-1", kFreq, SessionTimeouts{});
  assert(idle.OnDisconnected(kT0).empty());
  assert(idle.state() == SessionState::kIdle);
}

} // namespace

int main() {
  TestHappyPath();
  TestSilenceAndBlankTranscriptComplete();
  TestTranscriptionRetriesThenSaysAgain();
  TestDeadlinesAbort();
  TestFailuresAbort();
  TestRadioInputRules();

  std::cout << "awacs_unit_radio_session: pass\n";
  return 0;
}
