#pragma once

#include <functional>

namespace awacs::runtime {

// Runs tasks off the caller's thread.
class Executor {
 public:
  virtual ~Executor() = default;

  virtual void Submit(std::function<void()> task) = 0;
};

} // namespace awacs::runtime
