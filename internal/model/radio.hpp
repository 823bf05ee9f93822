#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "internal/util/time.hpp"

namespace awacs::model {

using Frequency   = std::uint64_t; // Hz
using PilotId     = std::string;   // radio client identity
using AudioFrame  = std::vector<std::uint8_t>;
using AudioBuffer = std::vector<AudioFrame>;

// Key-down (push-to-talk pressed).
struct TransmissionStarted {
  PilotId          pilot;
  Frequency        frequency{0};
  util::SteadyTime at{};
};

struct AudioReceived {
  PilotId          pilot;
  Frequency        frequency{0};
  AudioFrame       frame;
  util::SteadyTime at{};
};

// Key-up (push-to-talk released).
struct TransmissionEnded {
  PilotId          pilot;
  Frequency        frequency{0};
  util::SteadyTime at{};
};

struct PilotDisconnected {
  PilotId          pilot;
  Frequency        frequency{0};
  util::SteadyTime at{};
};

using RadioEvent = std::variant<TransmissionStarted, AudioReceived, TransmissionEnded, PilotDisconnected>;

} // namespace awacs::model
