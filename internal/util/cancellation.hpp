#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace awacs::util {

/*
  Cooperative cancellation flag shared between a session and the
  collaborator call it started. Collaborators may register a hook
  (e.g. grpc::ClientContext::TryCancel) that fires once on Cancel().
*/
class CancellationToken {
 public:
  bool cancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  void Cancel() {
    std::vector<std::function<void()>> hooks;
    {
      std::lock_guard lock(mutex_);
      if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;
      }
      hooks.swap(hooks_);
    }
    for (auto& hook : hooks) {
      hook();
    }
  }

  // Runs immediately when the token is already cancelled.
  void OnCancel(std::function<void()> hook) {
    {
      std::lock_guard lock(mutex_);
      if (!cancelled_.load(std::memory_order_acquire)) {
        hooks_.push_back(std::move(hook));
        return;
      }
    }
    hook();
  }

 private:
  std::atomic<bool>                  cancelled_{false};
  std::mutex                         mutex_;
  std::vector<std::function<void()>> hooks_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

inline CancellationTokenPtr MakeCancellationToken() {
  return std::make_shared<CancellationToken>();
}

} // namespace awacs::util
