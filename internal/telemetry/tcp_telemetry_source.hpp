#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/telemetry/telemetry_source.hpp"

namespace awacs::telemetry {

struct TcpTelemetryOptions {
  std::string    host;
  std::uint16_t  port{42674};
  std::string    username;
  std::string    password_hash{"0"};
  util::Duration connect_timeout{std::chrono::seconds(5)};
};

/*
  Tacview real-time telemetry client over TCP.

  After connecting, the client sends the XtraLib handshake and consumes
  the server's handshake block (terminated by NUL) before handing out
  ACMI lines.
*/
class TcpTelemetrySource final : public TelemetrySource {
 public:
  explicit TcpTelemetrySource(TcpTelemetryOptions options);
  ~TcpTelemetrySource() override;

  TcpTelemetrySource(const TcpTelemetrySource&)            = delete;
  TcpTelemetrySource& operator=(const TcpTelemetrySource&) = delete;

  void                       Connect() override;
  std::optional<std::string> ReadLine(util::Duration timeout) override;
  void                       Close() override;
  std::string                Describe() const override;

 private:
  void SendAll(const std::string& data);
  bool FillBuffer(util::Duration timeout);
  void ReadServerHandshake();

  TcpTelemetryOptions options_;
  int                 fd_ = -1;
  std::string         buffer_;
};

} // namespace awacs::telemetry
