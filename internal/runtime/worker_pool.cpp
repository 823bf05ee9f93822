#include "worker_pool.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"

namespace awacs::runtime {

using awacs::observability::StringField;
using awacs::observability::UintField;

WorkerPool::WorkerPool(std::size_t threads) : thread_count_(std::max<std::size_t>(threads, 1)) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) {
    return;
  }
  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this, i);
  }
}

void WorkerPool::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  queue_.Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

void WorkerPool::Submit(std::function<void()> task) {
  if (!queue_.Enqueue(std::move(task))) {
    AWACS_LOG_WARN("worker pool stopped; task dropped");
  }
}

void WorkerPool::Run(std::size_t index) {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) {
      break;
    }

    try {
      (*task)();
    } catch (const std::exception& e) {
      AWACS_LOG_ERROR("worker task failed", {UintField("worker", index), StringField("error", e.what())});
    }
  }
}

} // namespace awacs::runtime
