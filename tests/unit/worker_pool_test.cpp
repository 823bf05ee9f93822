#include "internal/runtime/worker_pool.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

using awacs::runtime::TaskQueue;
using awacs::runtime::WorkerPool;

void TestQueueDrainsAfterShutdown() {
  TaskQueue queue;
  int       ran = 0;
  assert(queue.Enqueue([&] { ++ran; }));
  assert(queue.Enqueue([&] { ++ran; }));
  queue.Shutdown();
  assert(!queue.Enqueue([&] { ++ran; }));
  assert(queue.size() == 2);

  while (auto task = queue.Dequeue()) {
    (*task)();
  }
  assert(ran == 2);
}

void TestPoolRunsEverySubmittedTask() {
  WorkerPool       pool(4);
  std::atomic<int> ran{0};
  pool.Start();
  for (int i = 0; i < 200; ++i) {
    pool.Submit([&] { ran.fetch_add(1); });
  }
  pool.Stop();
  assert(ran.load() == 200);
}

void TestFailingTaskDoesNotKillWorker() {
  WorkerPool       pool(1);
  std::atomic<int> ran{0};
  pool.Start();
  pool.Submit([] { throw std::runtime_error("boom"); });
  pool.Submit([&] { ran.fetch_add(1); });
  pool.Stop();
  assert(ran.load() == 1);

  // Dropped once stopped.
  pool.Submit([&] { ran.fetch_add(1); });
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  assert(ran.load() == 1);
}

} // namespace

int main() {
  TestQueueDrainsAfterShutdown();
  TestPoolRunsEverySubmittedTask();
  TestFailingTaskDoesNotKillWorker();

  std::cout << "awacs_unit_worker_pool: pass\n";
  return 0;
}
