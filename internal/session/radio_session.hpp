#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/radio.hpp"
#include "internal/radio/radio_transport.hpp"
#include "internal/session/session_state.hpp"
#include "internal/speech/speech.hpp"
#include "internal/util/time.hpp"

namespace awacs::session {

using SessionId = std::uint64_t;
using OpId      = std::uint64_t;

struct SessionTimeouts {
  util::Duration max_transmission{std::chrono::seconds(20)};
  util::Duration transcription_timeout{std::chrono::seconds(15)};
  util::Duration composition_timeout{std::chrono::seconds(5)};
  util::Duration synthesis_timeout{std::chrono::seconds(15)};
  util::Duration channel_wait_timeout{std::chrono::seconds(20)};
  util::Duration transmit_timeout{std::chrono::seconds(60)};
  std::uint32_t  transcription_attempts{2};
};

// ---------------- effects ----------------
// Work the owner performs after a transition. Async work is tagged with
// the op id its completion must present.

struct BeginTranscription {
  OpId                      op{0};
  awacs::model::AudioBuffer audio;
  std::uint32_t             attempt{1};
};

struct BeginComposition {
  OpId        op{0};
  std::string transcript;
};

struct BeginSynthesis {
  OpId        op{0};
  std::string script;
};

struct RequestChannel {};

struct ReleaseChannel {};

struct BeginTransmission {
  OpId                      op{0};
  awacs::model::AudioBuffer audio;
};

struct CancelPending {
  OpId op{0};
};

// Queue a fresh "say again" exchange for this pilot.
struct QueueSayAgain {};

using Effect  = std::variant<BeginTranscription, BeginComposition, BeginSynthesis, RequestChannel, ReleaseChannel, BeginTransmission,
                            CancelPending, QueueSayAgain>;
using Effects = std::vector<Effect>;

/*
  One pilot's voice exchange as an explicit state machine.

  Pure: no threads, no I/O, no clock. Every input carries `now`; every
  non-idle state carries a deadline that OnTick() enforces. Radio input
  in a state that does not accept it throws util::InvalidState;
  completions for an op that is no longer pending are ignored.

    Idle -> Receiving -> Transcribing -> Composing -> Synthesizing
         -> AwaitingChannel -> Transmitting -> Idle (completed)

  Any non-idle state may abort. Aborted is terminal.
*/
class RadioSession {
 public:
  RadioSession(SessionId id, awacs::model::PilotId pilot, awacs::model::Frequency frequency, SessionTimeouts timeouts);

  // ---------------- radio input ----------------
  Effects OnTransmissionStarted(util::SteadyTime now);
  Effects OnAudio(awacs::model::AudioFrame frame, util::SteadyTime now);
  Effects OnTransmissionEnded(util::SteadyTime now);
  Effects OnDisconnected(util::SteadyTime now);

  // Starts a controller-initiated reply (say again) from Idle.
  Effects StartReply(std::string script, util::SteadyTime now);

  // ---------------- collaborator completions ----------------
  Effects OnTranscription(OpId op, speech::TranscriptionResult result, util::SteadyTime now);
  // nullopt script: nothing to say (transmission not for us).
  Effects OnComposed(OpId op, std::optional<std::string> script, util::SteadyTime now);
  Effects OnCompositionFailed(OpId op, util::SteadyTime now);
  Effects OnSynthesis(OpId op, speech::SynthesisResult result, util::SteadyTime now);
  Effects OnChannelGranted(util::SteadyTime now);
  Effects OnTransmitted(OpId op, radio::TransmitResult result, util::SteadyTime now);

  Effects OnTick(util::SteadyTime now);

  Effects Abort(AbortReason reason);

  // Whether `event` is legal input right now.
  bool Accepts(const awacs::model::RadioEvent& event) const;

  bool Matches(OpId op) const {
    return pending_op_ && *pending_op_ == op;
  }

  SessionId id() const {
    return id_;
  }

  const awacs::model::PilotId& pilot() const {
    return pilot_;
  }

  awacs::model::Frequency frequency() const {
    return frequency_;
  }

  SessionState state() const {
    return state_;
  }

  std::optional<util::SteadyTime> deadline() const {
    return deadline_;
  }

  AbortReason abort_reason() const {
    return abort_reason_;
  }

  std::uint32_t transcription_attempt() const {
    return attempt_;
  }

  std::optional<util::SteadyTime> transmission_ended_at() const {
    return ended_at_;
  }

  // Returned to Idle after an exchange (replied, or nothing to reply).
  bool completed() const {
    return completed_;
  }

  // Completed with a transmitted reply.
  bool replied() const {
    return replied_;
  }

  bool finished() const {
    return completed_ || IsTerminal(state_);
  }

 private:
  void TransitionTo(SessionState next, std::optional<util::SteadyTime> deadline);
  OpId NextOp();
  void Complete();
  void RequireState(SessionState expected, const char* input) const;

  SessionId               id_;
  awacs::model::PilotId   pilot_;
  awacs::model::Frequency frequency_;
  SessionTimeouts         timeouts_;

  SessionState                    state_{SessionState::kIdle};
  std::optional<util::SteadyTime> deadline_;
  std::optional<OpId>             pending_op_;
  OpId                            next_op_{1};
  std::uint32_t                   attempt_{0};
  AbortReason                     abort_reason_{AbortReason::kNone};
  bool                            completed_{false};
  bool                            replied_{false};

  awacs::model::AudioBuffer       received_;
  awacs::model::AudioBuffer       reply_audio_;
  std::optional<util::SteadyTime> ended_at_;
};

} // namespace awacs::session
