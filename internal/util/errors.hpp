#pragma once

#include <stdexcept>
#include <string>

namespace awacs::util {

/*
  Central error types.

  Radio-flow errors are caught by the session layer and turned into
  replies or aborts; the admin surface translates them to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Telemetry or radio link lost. Recovered by reconnecting.
class TransportDisconnected : public std::runtime_error {
 public:
  explicit TransportDisconnected(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A single telemetry record or radio packet could not be decoded.
class MalformedRecord : public std::runtime_error {
 public:
  explicit MalformedRecord(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RequesterNotFound : public NotFound {
 public:
  explicit RequesterNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class RequesterNotFriendly : public std::runtime_error {
 public:
  explicit RequesterNotFriendly(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnrecognizedRequest : public std::runtime_error {
 public:
  explicit UnrecognizedRequest(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CollaboratorFailure : public std::runtime_error {
 public:
  explicit CollaboratorFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ChannelBusy : public std::runtime_error {
 public:
  explicit ChannelBusy(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace awacs::util
