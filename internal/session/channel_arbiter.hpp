#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/model/radio.hpp"
#include "internal/session/radio_session.hpp"
#include "internal/util/time.hpp"

namespace awacs::session {

/*
  Per-frequency transmit lock.

  At most one session holds a frequency. Waiters are granted in request
  order. A frequency is free only when no session holds it and no human
  talker is keyed on it. Calls that free a frequency return the session
  that was granted it next, if any; the caller delivers the grant.

  A talker whose key-up never arrives is dropped by ExpireTalkers once
  its key-down is older than the longest allowed transmission.
*/
class ChannelArbiter {
 public:
  struct ExpiredTalkers {
    std::vector<std::pair<awacs::model::Frequency, awacs::model::PilotId>> talkers;
    std::vector<std::pair<awacs::model::Frequency, SessionId>>             grants;
  };

  // True when granted immediately; otherwise the session is queued.
  bool Request(awacs::model::Frequency frequency, SessionId session);

  // Releases the lock, or withdraws a queued request.
  std::optional<SessionId> Release(awacs::model::Frequency frequency, SessionId session);

  // Keying again refreshes the talker's key-down time.
  void                     KeyDown(awacs::model::Frequency frequency, const awacs::model::PilotId& pilot, util::SteadyTime at);
  std::optional<SessionId> KeyUp(awacs::model::Frequency frequency, const awacs::model::PilotId& pilot);

  // Drops talkers keyed at or before `keyed_before`.
  ExpiredTalkers ExpireTalkers(util::SteadyTime keyed_before);

  std::optional<SessionId> Holder(awacs::model::Frequency frequency) const;
  bool                     Busy(awacs::model::Frequency frequency) const;
  std::size_t              Waiting(awacs::model::Frequency frequency) const;

 private:
  struct Channel {
    std::optional<SessionId>                          holder;
    std::deque<SessionId>                             waiters;
    std::map<awacs::model::PilotId, util::SteadyTime> talkers;
  };

  static bool              Free(const Channel& channel);
  std::optional<SessionId> GrantNext(Channel& channel);

  mutable std::mutex                                   mutex_;
  std::unordered_map<awacs::model::Frequency, Channel> channels_;
};

} // namespace awacs::session
