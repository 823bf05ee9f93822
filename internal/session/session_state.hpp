#pragma once

#include <cstdint>
#include <string_view>

namespace awacs::session {

enum class SessionState : std::uint8_t {
  kIdle            = 0,
  kReceiving       = 1,
  kTranscribing    = 2,
  kComposing       = 3,
  kSynthesizing    = 4,
  kAwaitingChannel = 5,
  kTransmitting    = 6,
  kAborted         = 7,
};

constexpr bool IsTerminal(SessionState state) {
  return state == SessionState::kAborted;
}

// Radio input (key-down, audio, key-up) is only legal here.
constexpr bool AcceptsRadioInput(SessionState state) {
  return state == SessionState::kIdle || state == SessionState::kReceiving;
}

constexpr bool CanTransition(SessionState from, SessionState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == SessionState::kAborted) {
    return from != SessionState::kIdle;
  }

  switch (from) {
    case SessionState::kIdle:
      // A reply session starts directly in synthesis.
      return to == SessionState::kReceiving || to == SessionState::kSynthesizing;
    case SessionState::kReceiving:
      return to == SessionState::kTranscribing || to == SessionState::kIdle;
    case SessionState::kTranscribing:
      // Retry, or a blank transcript ends the exchange.
      return to == SessionState::kTranscribing || to == SessionState::kComposing || to == SessionState::kIdle;
    case SessionState::kComposing:
      return to == SessionState::kSynthesizing || to == SessionState::kIdle;
    case SessionState::kSynthesizing:
      return to == SessionState::kAwaitingChannel;
    case SessionState::kAwaitingChannel:
      return to == SessionState::kTransmitting;
    case SessionState::kTransmitting:
      return to == SessionState::kIdle;
    case SessionState::kAborted:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(SessionState state) {
  switch (state) {
    case SessionState::kIdle:
      return "idle";
    case SessionState::kReceiving:
      return "receiving";
    case SessionState::kTranscribing:
      return "transcribing";
    case SessionState::kComposing:
      return "composing";
    case SessionState::kSynthesizing:
      return "synthesizing";
    case SessionState::kAwaitingChannel:
      return "awaiting_channel";
    case SessionState::kTransmitting:
      return "transmitting";
    case SessionState::kAborted:
      return "aborted";
  }
  return "unknown";
}

enum class AbortReason : std::uint8_t {
  kNone,
  kTimeout,
  kCollaboratorFailure,
  kChannelBusy,
  kTransportError,
  kDisconnected,
  kInternalError,
  kShutdown,
};

constexpr std::string_view ToString(AbortReason reason) {
  switch (reason) {
    case AbortReason::kNone:
      return "none";
    case AbortReason::kTimeout:
      return "timeout";
    case AbortReason::kCollaboratorFailure:
      return "collaborator_failure";
    case AbortReason::kChannelBusy:
      return "channel_busy";
    case AbortReason::kTransportError:
      return "transport_error";
    case AbortReason::kDisconnected:
      return "disconnected";
    case AbortReason::kInternalError:
      return "internal_error";
    case AbortReason::kShutdown:
      return "shutdown";
  }
  return "none";
}

} // namespace awacs::session
