#include "internal/session/channel_arbiter.hpp"

#include <algorithm>

namespace awacs::session {

bool ChannelArbiter::Free(const Channel& channel) {
  return !channel.holder && channel.talkers.empty();
}

std::optional<SessionId> ChannelArbiter::GrantNext(Channel& channel) {
  if (!Free(channel) || channel.waiters.empty()) {
    return std::nullopt;
  }
  channel.holder = channel.waiters.front();
  channel.waiters.pop_front();
  return channel.holder;
}

bool ChannelArbiter::Request(awacs::model::Frequency frequency, SessionId session) {
  std::lock_guard lock(mutex_);
  auto&           channel = channels_[frequency];

  if (channel.holder == session) {
    return true;
  }
  if (Free(channel) && channel.waiters.empty()) {
    channel.holder = session;
    return true;
  }
  if (std::find(channel.waiters.begin(), channel.waiters.end(), session) == channel.waiters.end()) {
    channel.waiters.push_back(session);
  }
  return false;
}

std::optional<SessionId> ChannelArbiter::Release(awacs::model::Frequency frequency, SessionId session) {
  std::lock_guard lock(mutex_);
  auto            it = channels_.find(frequency);
  if (it == channels_.end()) {
    return std::nullopt;
  }

  auto& channel = it->second;
  if (channel.holder == session) {
    channel.holder.reset();
  } else {
    auto& waiters = channel.waiters;
    waiters.erase(std::remove(waiters.begin(), waiters.end(), session), waiters.end());
  }
  return GrantNext(channel);
}

void ChannelArbiter::KeyDown(awacs::model::Frequency frequency, const awacs::model::PilotId& pilot, util::SteadyTime at) {
  std::lock_guard lock(mutex_);
  channels_[frequency].talkers.insert_or_assign(pilot, at);
}

std::optional<SessionId> ChannelArbiter::KeyUp(awacs::model::Frequency frequency, const awacs::model::PilotId& pilot) {
  std::lock_guard lock(mutex_);
  auto            it = channels_.find(frequency);
  if (it == channels_.end()) {
    return std::nullopt;
  }
  it->second.talkers.erase(pilot);
  return GrantNext(it->second);
}

ChannelArbiter::ExpiredTalkers ChannelArbiter::ExpireTalkers(util::SteadyTime keyed_before) {
  std::lock_guard lock(mutex_);
  ExpiredTalkers  out;
  for (auto& [frequency, channel] : channels_) {
    bool dropped = false;
    for (auto it = channel.talkers.begin(); it != channel.talkers.end();) {
      if (it->second <= keyed_before) {
        out.talkers.emplace_back(frequency, it->first);
        it      = channel.talkers.erase(it);
        dropped = true;
      } else {
        ++it;
      }
    }
    if (dropped) {
      if (auto next = GrantNext(channel)) {
        out.grants.emplace_back(frequency, *next);
      }
    }
  }
  return out;
}

std::optional<SessionId> ChannelArbiter::Holder(awacs::model::Frequency frequency) const {
  std::lock_guard lock(mutex_);
  auto            it = channels_.find(frequency);
  if (it == channels_.end()) {
    return std::nullopt;
  }
  return it->second.holder;
}

bool ChannelArbiter::Busy(awacs::model::Frequency frequency) const {
  std::lock_guard lock(mutex_);
  auto            it = channels_.find(frequency);
  return it != channels_.end() && !Free(it->second);
}

std::size_t ChannelArbiter::Waiting(awacs::model::Frequency frequency) const {
  std::lock_guard lock(mutex_);
  auto            it = channels_.find(frequency);
  return it == channels_.end() ? 0 : it->second.waiters.size();
}

} // namespace awacs::session
