#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/session/session_dispatcher.hpp"
#include "internal/util/time.hpp"

namespace awacs::runtime {

/*
  Periodically advances session deadlines.
*/
class SessionTicker {
 public:
  SessionTicker(std::shared_ptr<session::SessionDispatcher> dispatcher, util::Duration interval);
  ~SessionTicker();

  SessionTicker(const SessionTicker&)            = delete;
  SessionTicker& operator=(const SessionTicker&) = delete;

  void Start();
  void Stop();

 private:
  void Loop();

  std::shared_ptr<session::SessionDispatcher> dispatcher_;
  util::Duration                              interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace awacs::runtime
