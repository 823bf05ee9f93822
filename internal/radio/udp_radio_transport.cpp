#include "internal/radio/udp_radio_transport.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace awacs::radio {

using awacs::observability::IntField;
using awacs::observability::StringField;
using awacs::observability::UintField;

namespace {

constexpr int kPollMs = 200;

sockaddr_in ResolveIpv4(const std::string& host, std::uint16_t port) {
  addrinfo hints{};
  hints.ai_family   = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;

  addrinfo* result = nullptr;
  const int rc     = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
  if (rc != 0 || result == nullptr) {
    throw util::TransportDisconnected("resolve " + host + ": " + ::gai_strerror(rc));
  }
  sockaddr_in addr{};
  std::memcpy(&addr, result->ai_addr, sizeof(addr));
  ::freeaddrinfo(result);
  addr.sin_port = htons(port);
  return addr;
}

} // namespace

UdpRadioTransport::UdpRadioTransport(UdpRadioOptions options) : options_(std::move(options)) {
}

UdpRadioTransport::~UdpRadioTransport() {
  Stop();
}

// ------------------------------------------------------------
// Socket lifecycle
// ------------------------------------------------------------

void UdpRadioTransport::OpenSocket() {
  const auto local  = ResolveIpv4(options_.bind_address, options_.bind_port);
  const auto server = ResolveIpv4(options_.server_address, options_.server_port);

  const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    throw util::TransportDisconnected("socket: " + std::string(std::strerror(errno)));
  }

  const int reuse = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  if (::bind(fd, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) < 0) {
    const auto error = std::string(std::strerror(errno));
    ::close(fd);
    throw util::TransportDisconnected("bind " + options_.bind_address + ":" + std::to_string(options_.bind_port) + ": " + error);
  }

  // Connected UDP: send() goes to the server and only its datagrams are received.
  if (::connect(fd, reinterpret_cast<const sockaddr*>(&server), sizeof(server)) < 0) {
    const auto error = std::string(std::strerror(errno));
    ::close(fd);
    throw util::TransportDisconnected("connect " + options_.server_address + ":" + std::to_string(options_.server_port) + ": " + error);
  }

  fd_ = fd;
  AWACS_LOG_INFO("radio socket open", {StringField("server", options_.server_address), UintField("port", options_.server_port)});
}

void UdpRadioTransport::CloseSocket() {
  const int fd = fd_.exchange(-1);
  if (fd >= 0) {
    ::close(fd);
  }
}

void UdpRadioTransport::ReopenWithBackoff() {
  std::lock_guard lock(socket_mutex_);
  CloseSocket();
  while (running_) {
    try {
      OpenSocket();
      backoff_    = std::chrono::seconds(1);
      last_hello_ = {};
      return;
    } catch (const util::TransportDisconnected& e) {
      reopens_.fetch_add(1, std::memory_order_relaxed);
      AWACS_LOG_WARN("radio socket reopen failed", {StringField("reason", e.what()), IntField("retry_in_ms", backoff_.count())});
    }
    const auto deadline = util::SteadyNow() + backoff_;
    while (running_ && util::SteadyNow() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(kPollMs));
    }
    backoff_ = std::min(backoff_ * 2, options_.reconnect_max_backoff);
  }
}

bool UdpRadioTransport::SendPacket(const RadioPacket& packet) {
  const auto bytes = EncodePacket(packet);
  const int  fd    = fd_.load();
  if (fd < 0) {
    return false;
  }
  const ssize_t n = ::send(fd, bytes.data(), bytes.size(), 0);
  if (n < 0 || static_cast<std::size_t>(n) != bytes.size()) {
    AWACS_LOG_WARN("radio send failed", {StringField("reason", std::strerror(errno))});
    return false;
  }
  sent_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

// ------------------------------------------------------------
// Start / Stop
// ------------------------------------------------------------

void UdpRadioTransport::Start(RadioEventHandler handler) {
  if (running_.exchange(true)) {
    return;
  }
  handler_ = std::move(handler);

  try {
    std::lock_guard lock(socket_mutex_);
    OpenSocket();
  } catch (const util::TransportDisconnected& e) {
    // The receive thread keeps retrying.
    AWACS_LOG_WARN("radio socket unavailable at start", {StringField("reason", e.what())});
  }

  receive_thread_ = std::thread(&UdpRadioTransport::ReceiveLoop, this);
  send_thread_    = std::thread(&UdpRadioTransport::SendLoop, this);
}

void UdpRadioTransport::Stop() {
  {
    std::lock_guard lock(jobs_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  jobs_cv_.notify_all();

  if (receive_thread_.joinable()) {
    receive_thread_.join();
  }
  if (send_thread_.joinable()) {
    send_thread_.join();
  }

  std::deque<Job> abandoned;
  {
    std::lock_guard lock(jobs_mutex_);
    abandoned.swap(jobs_);
  }
  for (auto& job : abandoned) {
    job.done(TransmitResult{false, "radio transport stopped"});
  }

  CloseSocket();
}

UdpRadioStats UdpRadioTransport::stats() const {
  UdpRadioStats stats;
  stats.packets_received  = received_.load();
  stats.packets_malformed = malformed_.load();
  stats.packets_sent      = sent_.load();
  stats.reopens           = reopens_.load();
  return stats;
}

// ------------------------------------------------------------
// Receive
// ------------------------------------------------------------

void UdpRadioTransport::ReceiveLoop() {
  std::uint8_t buffer[kMaxDatagramLen];

  while (running_) {
    int fd = fd_.load();
    if (fd < 0) {
      ReopenWithBackoff();
      continue;
    }

    const auto now = util::SteadyNow();
    if (last_hello_ == util::SteadyTime{} || now - last_hello_ >= options_.hello_interval) {
      last_hello_ = now;
      SendPacket(MakeHello(options_.unit_name, options_.frequencies));
    }

    pollfd pfd{};
    pfd.fd     = fd;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, kPollMs);
    if (ready == 0 || (ready < 0 && errno == EINTR)) {
      continue;
    }
    // POLLERR falls through: recv() reports and clears the pending error.
    if (ready < 0 || (pfd.revents & (POLLHUP | POLLNVAL))) {
      AWACS_LOG_WARN("radio socket error; reopening");
      ReopenWithBackoff();
      continue;
    }

    // MSG_TRUNC reports the full datagram length even when the buffer is shorter.
    const ssize_t n = ::recv(fd, buffer, sizeof(buffer), MSG_TRUNC);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      if (errno == ECONNREFUSED) {
        // Server not listening yet; the next hello retries.
        std::this_thread::sleep_for(std::chrono::milliseconds(kPollMs));
        continue;
      }
      AWACS_LOG_WARN("radio recv failed; reopening", {StringField("reason", std::strerror(errno))});
      ReopenWithBackoff();
      continue;
    }

    received_.fetch_add(1, std::memory_order_relaxed);
    if (static_cast<std::size_t>(n) > sizeof(buffer)) {
      malformed_.fetch_add(1, std::memory_order_relaxed);
      AWACS_LOG_DEBUG("skipping oversized radio datagram", {UintField("bytes", static_cast<std::uint64_t>(n))});
      continue;
    }
    try {
      auto packet = DecodePacket(buffer, static_cast<std::size_t>(n));
      if (packet.pilot == options_.unit_name) {
        continue;
      }
      auto event = ToEvent(std::move(packet), util::SteadyNow());
      if (event) {
        handler_(std::move(*event));
      }
    } catch (const util::MalformedRecord& e) {
      malformed_.fetch_add(1, std::memory_order_relaxed);
      AWACS_LOG_DEBUG("skipping malformed radio packet", {StringField("reason", e.what())});
    }
  }
}

// ------------------------------------------------------------
// Send
// ------------------------------------------------------------

void UdpRadioTransport::Transmit(awacs::model::Frequency frequency, awacs::model::AudioBuffer frames, util::CancellationTokenPtr token,
                                 TransmitCallback done) {
  // Frames are sent whole; one the peer would truncate fails the reply.
  const auto limit = MaxPayloadFor(options_.unit_name);
  for (const auto& frame : frames) {
    if (frame.size() > limit) {
      AWACS_LOG_WARN("reply audio frame exceeds datagram size",
                     {UintField("frequency", frequency), UintField("frame_bytes", frame.size()), UintField("limit", limit)});
      done(TransmitResult{false, "audio frame exceeds datagram size"});
      return;
    }
  }

  {
    std::lock_guard lock(jobs_mutex_);
    if (running_) {
      jobs_.push_back(Job{frequency, std::move(frames), std::move(token), std::move(done)});
      jobs_cv_.notify_one();
      return;
    }
  }
  done(TransmitResult{false, "radio transport not running"});
}

void UdpRadioTransport::SendLoop() {
  while (true) {
    Job job;
    {
      std::unique_lock lock(jobs_mutex_);
      jobs_cv_.wait(lock, [&] { return !running_ || !jobs_.empty(); });
      if (!running_) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }

    auto result = Play(job);
    job.done(std::move(result));
  }
}

TransmitResult UdpRadioTransport::Play(Job& job) {
  RadioPacket packet;
  packet.frequency = job.frequency;
  packet.pilot     = options_.unit_name;

  auto send = [&](PacketType type, awacs::model::AudioFrame payload) {
    packet.type     = type;
    packet.sequence = sequence_++;
    packet.payload  = std::move(payload);
    try {
      return SendPacket(packet);
    } catch (const util::MalformedRecord& e) {
      AWACS_LOG_WARN("radio packet not encodable", {UintField("frequency", job.frequency), StringField("reason", e.what())});
      return false;
    }
  };

  if (!send(PacketType::kKeyDown, {})) {
    return TransmitResult{false, "radio socket unavailable"};
  }

  auto next = util::SteadyNow();
  for (auto& frame : job.frames) {
    if (!running_ || (job.token && job.token->cancelled())) {
      send(PacketType::kKeyUp, {});
      return TransmitResult{false, "cancelled"};
    }
    std::this_thread::sleep_until(next);
    if (!send(PacketType::kAudio, std::move(frame))) {
      send(PacketType::kKeyUp, {});
      return TransmitResult{false, "radio send failed"};
    }
    next += options_.frame_interval;
  }

  send(PacketType::kKeyUp, {});
  return TransmitResult{true, {}};
}

} // namespace awacs::radio
