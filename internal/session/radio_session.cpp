#include "internal/session/radio_session.hpp"

#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace awacs::session {

RadioSession::RadioSession(SessionId id, awacs::model::PilotId pilot, awacs::model::Frequency frequency, SessionTimeouts timeouts)
    : id_(id), pilot_(std::move(pilot)), frequency_(frequency), timeouts_(timeouts) {
  if (timeouts_.transcription_attempts == 0) {
    timeouts_.transcription_attempts = 1;
  }
}

// ---------------- radio input ----------------

Effects RadioSession::OnTransmissionStarted(util::SteadyTime now) {
  RequireState(SessionState::kIdle, "transmission start");
  received_.clear();
  ended_at_.reset();
  TransitionTo(SessionState::kReceiving, now + timeouts_.max_transmission);
  return {};
}

Effects RadioSession::OnAudio(awacs::model::AudioFrame frame, util::SteadyTime) {
  RequireState(SessionState::kReceiving, "audio");
  if (!frame.empty()) {
    received_.push_back(std::move(frame));
  }
  return {};
}

Effects RadioSession::OnTransmissionEnded(util::SteadyTime now) {
  RequireState(SessionState::kReceiving, "transmission end");
  ended_at_ = now;

  if (received_.empty()) {
    Complete();
    return {};
  }

  attempt_      = 1;
  const auto op = NextOp();
  TransitionTo(SessionState::kTranscribing, now + timeouts_.transcription_timeout);
  // Audio is kept until transcription succeeds so a retry can resend it.
  return {BeginTranscription{op, received_, attempt_}};
}

Effects RadioSession::OnDisconnected(util::SteadyTime) {
  if (state_ == SessionState::kIdle || finished()) {
    return {};
  }
  return Abort(AbortReason::kDisconnected);
}

Effects RadioSession::StartReply(std::string script, util::SteadyTime now) {
  RequireState(SessionState::kIdle, "reply");
  const auto op = NextOp();
  TransitionTo(SessionState::kSynthesizing, now + timeouts_.synthesis_timeout);
  return {BeginSynthesis{op, std::move(script)}};
}

// ---------------- collaborator completions ----------------

Effects RadioSession::OnTranscription(OpId op, speech::TranscriptionResult result, util::SteadyTime now) {
  if (state_ != SessionState::kTranscribing || !Matches(op)) {
    return {};
  }
  pending_op_.reset();

  if (!result.ok) {
    if (attempt_ < timeouts_.transcription_attempts) {
      ++attempt_;
      const auto retry = NextOp();
      TransitionTo(SessionState::kTranscribing, now + timeouts_.transcription_timeout);
      return {BeginTranscription{retry, received_, attempt_}};
    }
    auto effects = Abort(AbortReason::kCollaboratorFailure);
    effects.emplace_back(QueueSayAgain{});
    return effects;
  }

  received_.clear();
  received_.shrink_to_fit();

  if (result.text.find_first_not_of(" \t\r\n") == std::string::npos) {
    Complete();
    return {};
  }

  const auto next = NextOp();
  TransitionTo(SessionState::kComposing, now + timeouts_.composition_timeout);
  return {BeginComposition{next, std::move(result.text)}};
}

Effects RadioSession::OnComposed(OpId op, std::optional<std::string> script, util::SteadyTime now) {
  if (state_ != SessionState::kComposing || !Matches(op)) {
    return {};
  }
  pending_op_.reset();

  if (!script) {
    Complete();
    return {};
  }

  const auto next = NextOp();
  TransitionTo(SessionState::kSynthesizing, now + timeouts_.synthesis_timeout);
  return {BeginSynthesis{next, std::move(*script)}};
}

Effects RadioSession::OnCompositionFailed(OpId op, util::SteadyTime) {
  if (state_ != SessionState::kComposing || !Matches(op)) {
    return {};
  }
  pending_op_.reset();
  return Abort(AbortReason::kInternalError);
}

Effects RadioSession::OnSynthesis(OpId op, speech::SynthesisResult result, util::SteadyTime now) {
  if (state_ != SessionState::kSynthesizing || !Matches(op)) {
    return {};
  }
  pending_op_.reset();

  if (!result.ok || result.frames.empty()) {
    return Abort(AbortReason::kCollaboratorFailure);
  }

  reply_audio_ = std::move(result.frames);
  TransitionTo(SessionState::kAwaitingChannel, now + timeouts_.channel_wait_timeout);
  return {RequestChannel{}};
}

Effects RadioSession::OnChannelGranted(util::SteadyTime now) {
  RequireState(SessionState::kAwaitingChannel, "channel grant");
  const auto op = NextOp();
  TransitionTo(SessionState::kTransmitting, now + timeouts_.transmit_timeout);
  return {BeginTransmission{op, std::move(reply_audio_)}};
}

Effects RadioSession::OnTransmitted(OpId op, radio::TransmitResult result, util::SteadyTime) {
  if (state_ != SessionState::kTransmitting || !Matches(op)) {
    return {};
  }
  pending_op_.reset();

  if (!result.ok) {
    return Abort(AbortReason::kTransportError);
  }

  replied_ = true;
  Complete();
  return {ReleaseChannel{}};
}

// ---------------- deadlines ----------------

Effects RadioSession::OnTick(util::SteadyTime now) {
  if (finished() || state_ == SessionState::kIdle || !deadline_ || now < *deadline_) {
    return {};
  }

  switch (state_) {
    case SessionState::kTranscribing: {
      auto effects = Abort(AbortReason::kTimeout);
      effects.emplace_back(QueueSayAgain{});
      return effects;
    }
    case SessionState::kAwaitingChannel:
      return Abort(AbortReason::kChannelBusy);
    default:
      return Abort(AbortReason::kTimeout);
  }
}

Effects RadioSession::Abort(AbortReason reason) {
  if (finished() || state_ == SessionState::kIdle) {
    return {};
  }

  Effects effects;
  if (pending_op_) {
    effects.emplace_back(CancelPending{*pending_op_});
    pending_op_.reset();
  }
  if (state_ == SessionState::kAwaitingChannel || state_ == SessionState::kTransmitting) {
    effects.emplace_back(ReleaseChannel{});
  }

  received_.clear();
  received_.shrink_to_fit();
  reply_audio_.clear();
  reply_audio_.shrink_to_fit();

  abort_reason_ = reason;
  TransitionTo(SessionState::kAborted, std::nullopt);
  return effects;
}

bool RadioSession::Accepts(const awacs::model::RadioEvent& event) const {
  if (finished()) {
    return false;
  }

  if (const auto* started = std::get_if<awacs::model::TransmissionStarted>(&event)) {
    return started->frequency == frequency_ && state_ == SessionState::kIdle;
  }
  if (const auto* audio = std::get_if<awacs::model::AudioReceived>(&event)) {
    return audio->frequency == frequency_ && state_ == SessionState::kReceiving;
  }
  if (const auto* ended = std::get_if<awacs::model::TransmissionEnded>(&event)) {
    return ended->frequency == frequency_ && state_ == SessionState::kReceiving;
  }
  // A disconnect ends the pilot's session whatever frequency it names.
  return std::holds_alternative<awacs::model::PilotDisconnected>(event);
}

// ---------------- internals ----------------

void RadioSession::TransitionTo(SessionState next, std::optional<util::SteadyTime> deadline) {
  if (!CanTransition(state_, next)) {
    throw util::InvalidState("session " + std::to_string(id_) + ": illegal transition " + std::string(ToString(state_)) + " -> " +
                             std::string(ToString(next)));
  }
  state_    = next;
  deadline_ = deadline;
}

OpId RadioSession::NextOp() {
  pending_op_ = next_op_++;
  return *pending_op_;
}

void RadioSession::Complete() {
  TransitionTo(SessionState::kIdle, std::nullopt);
  pending_op_.reset();
  completed_ = true;
}

void RadioSession::RequireState(SessionState expected, const char* input) const {
  if (completed_ || state_ != expected) {
    throw util::InvalidState("session " + std::to_string(id_) + ": " + input + " not accepted in state " + std::string(ToString(state_)));
  }
}

} // namespace awacs::session
