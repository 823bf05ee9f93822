#pragma once

#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace awacs::telemetry {

/*
  Line-oriented telemetry feed.

  Connect() and ReadLine() throw util::TransportDisconnected on any link
  failure; the ingestor owns reconnect and backoff.
*/
class TelemetrySource {
 public:
  virtual ~TelemetrySource() = default;

  virtual void Connect() = 0;

  // Next complete line without terminator; nullopt when nothing arrived within timeout.
  virtual std::optional<std::string> ReadLine(util::Duration timeout) = 0;

  virtual void Close() = 0;

  virtual std::string Describe() const = 0;
};

} // namespace awacs::telemetry
