#include "internal/telemetry/tcp_telemetry_source.hpp"

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "internal/util/errors.hpp"

namespace awacs::telemetry {

using awacs::util::TransportDisconnected;

namespace {

constexpr std::size_t kReadChunk        = 64 * 1024;
constexpr std::size_t kMaxLineBytes     = 1024 * 1024;
constexpr char        kStreamProtocol[] = "XtraLib.Stream.0";
constexpr char        kTelemetryProto[] = "Tacview.RealTimeTelemetry.0";

std::string ErrnoText() {
  return std::string(std::strerror(errno));
}

} // namespace

TcpTelemetrySource::TcpTelemetrySource(TcpTelemetryOptions options) : options_(std::move(options)) {
}

TcpTelemetrySource::~TcpTelemetrySource() {
  Close();
}

std::string TcpTelemetrySource::Describe() const {
  return options_.host + ":" + std::to_string(options_.port);
}

void TcpTelemetrySource::Connect() {
  Close();

  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo*   result  = nullptr;
  const auto  service = std::to_string(options_.port);
  const int   rc      = ::getaddrinfo(options_.host.c_str(), service.c_str(), &hints, &result);
  if (rc != 0) {
    throw TransportDisconnected("resolve " + Describe() + ": " + ::gai_strerror(rc));
  }

  std::string last_error = "no addresses";
  for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = ErrnoText();
      continue;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      fd_ = fd;
      break;
    }
    last_error = ErrnoText();
    ::close(fd);
  }
  ::freeaddrinfo(result);

  if (fd_ < 0) {
    throw TransportDisconnected("connect " + Describe() + ": " + last_error);
  }

  std::string handshake;
  handshake += kStreamProtocol;
  handshake += '\n';
  handshake += kTelemetryProto;
  handshake += '\n';
  handshake += options_.username;
  handshake += '\n';
  handshake += options_.password_hash;
  handshake.push_back('\0');
  SendAll(handshake);

  ReadServerHandshake();
}

void TcpTelemetrySource::SendAll(const std::string& data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const auto error = ErrnoText();
      Close();
      throw TransportDisconnected("send to " + Describe() + ": " + error);
    }
    sent += static_cast<std::size_t>(n);
  }
}

void TcpTelemetrySource::ReadServerHandshake() {
  while (true) {
    const auto nul = buffer_.find('\0');
    if (nul != std::string::npos) {
      const auto header = buffer_.substr(0, nul);
      buffer_.erase(0, nul + 1);
      if (header.rfind(kStreamProtocol, 0) != 0) {
        Close();
        throw TransportDisconnected("unexpected handshake from " + Describe());
      }
      return;
    }
    if (!FillBuffer(options_.connect_timeout)) {
      Close();
      throw TransportDisconnected("handshake timeout from " + Describe());
    }
  }
}

bool TcpTelemetrySource::FillBuffer(util::Duration timeout) {
  if (fd_ < 0) {
    throw TransportDisconnected("telemetry socket closed");
  }

  pollfd pfd{};
  pfd.fd     = fd_;
  pfd.events = POLLIN;

  const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  if (ready < 0) {
    if (errno == EINTR) {
      return false;
    }
    const auto error = ErrnoText();
    Close();
    throw TransportDisconnected("poll " + Describe() + ": " + error);
  }
  if (ready == 0) {
    return false;
  }

  char          chunk[kReadChunk];
  const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
  if (n == 0) {
    Close();
    throw TransportDisconnected("telemetry server " + Describe() + " closed the connection");
  }
  if (n < 0) {
    if (errno == EINTR || errno == EAGAIN) {
      return false;
    }
    const auto error = ErrnoText();
    Close();
    throw TransportDisconnected("recv " + Describe() + ": " + error);
  }

  buffer_.append(chunk, static_cast<std::size_t>(n));
  if (buffer_.size() > kMaxLineBytes && buffer_.find('\n') == std::string::npos) {
    Close();
    throw TransportDisconnected("line longer than " + std::to_string(kMaxLineBytes) + " bytes from " + Describe());
  }
  return true;
}

std::optional<std::string> TcpTelemetrySource::ReadLine(util::Duration timeout) {
  const auto deadline = util::SteadyNow() + timeout;
  while (true) {
    const auto newline = buffer_.find('\n');
    if (newline != std::string::npos) {
      std::string line = buffer_.substr(0, newline);
      buffer_.erase(0, newline + 1);
      return line;
    }

    const auto now = util::SteadyNow();
    if (now >= deadline) {
      return std::nullopt;
    }
    FillBuffer(std::chrono::duration_cast<util::Duration>(deadline - now));
  }
}

void TcpTelemetrySource::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  buffer_.clear();
}

} // namespace awacs::telemetry
