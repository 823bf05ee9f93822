#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace awacs::runtime {

/*
  Thread-safe blocking queue for worker threads.
*/
class TaskQueue {
 public:
  using Task = std::function<void()>;

  // Returns false once the queue is shut down.
  bool Enqueue(Task task);

  // Blocks until a task is available; nullopt after shutdown once drained.
  std::optional<Task> Dequeue();

  void Shutdown();

  std::size_t size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace awacs::runtime
