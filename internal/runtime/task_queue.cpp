#include "task_queue.hpp"

namespace awacs::runtime {

bool TaskQueue::Enqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      return false;
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<TaskQueue::Task> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) {
    return std::nullopt;
  }

  Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t TaskQueue::size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace awacs::runtime
