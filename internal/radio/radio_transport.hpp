#pragma once

#include <functional>
#include <string>

#include "internal/model/radio.hpp"
#include "internal/util/cancellation.hpp"

namespace awacs::radio {

struct TransmitResult {
  bool        ok{false};
  std::string error;
};

using RadioEventHandler = std::function<void(awacs::model::RadioEvent)>;
using TransmitCallback  = std::function<void(TransmitResult)>;

// Outbound half of the radio link.
class RadioSender {
 public:
  virtual ~RadioSender() = default;

  // Keys the frequency, sends frames paced in real time, unkeys.
  // `done` fires exactly once; cancellation unkeys immediately.
  virtual void Transmit(awacs::model::Frequency frequency, awacs::model::AudioBuffer frames, util::CancellationTokenPtr token,
                        TransmitCallback done) = 0;
};

/*
  Packet voice network connection. Delivers radio events for the
  monitored frequencies to the handler on the transport's own thread.
  Link errors are handled internally (reopen with backoff).
*/
class RadioTransport : public RadioSender {
 public:
  virtual void Start(RadioEventHandler handler) = 0;
  virtual void Stop()                           = 0;
};

} // namespace awacs::radio
