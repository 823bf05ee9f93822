#pragma once

#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

#include "internal/runtime/executor.hpp"
#include "internal/runtime/task_queue.hpp"

namespace awacs::runtime {

/*
  Fixed set of worker threads draining one TaskQueue.

  The controller runs two: one for call composition and one for
  blocking speech gateway calls, so a slow gateway never delays
  composition. Stop() drains queued tasks before joining.
*/
class WorkerPool final : public Executor {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool() override;

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  // Tasks submitted after Stop() are dropped and logged.
  void Submit(std::function<void()> task) override;

 private:
  void Run(std::size_t index);

  std::size_t              thread_count_;
  TaskQueue                queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace awacs::runtime
