#include "session_ticker.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace awacs::runtime {

SessionTicker::SessionTicker(std::shared_ptr<session::SessionDispatcher> dispatcher, util::Duration interval)
    : dispatcher_(std::move(dispatcher)), interval_(interval > util::Duration::zero() ? interval : std::chrono::milliseconds(100)) {
}

SessionTicker::~SessionTicker() {
  Stop();
}

void SessionTicker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&SessionTicker::Loop, this);
}

void SessionTicker::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void SessionTicker::Loop() {
  while (running_) {
    try {
      dispatcher_->Tick(util::SteadyNow());
    } catch (const std::exception& e) {
      AWACS_LOG_ERROR("session tick failed", {awacs::observability::StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace awacs::runtime
