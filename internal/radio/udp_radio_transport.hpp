#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/radio/radio_packet.hpp"
#include "internal/radio/radio_transport.hpp"
#include "internal/util/time.hpp"

namespace awacs::radio {

struct UdpRadioOptions {
  std::string   bind_address{"0.0.0.0"};
  std::uint16_t bind_port{5003};
  std::string   server_address{"127.0.0.1"};
  std::uint16_t server_port{5002};
  std::string   unit_name{"AWACS"};

  std::vector<awacs::model::Frequency> frequencies;

  util::Duration frame_interval{std::chrono::milliseconds(20)};
  util::Duration reconnect_max_backoff{std::chrono::seconds(30)};
  util::Duration hello_interval{std::chrono::seconds(5)};
};

struct UdpRadioStats {
  std::uint64_t packets_received{0};
  std::uint64_t packets_malformed{0};
  std::uint64_t packets_sent{0};
  std::uint64_t reopens{0};
};

/*
  Radio transport over UDP datagrams (see radio_packet.hpp).

  One receive thread decodes packets into events; one send thread plays
  queued transmissions one at a time, pacing frames at frame_interval.
  Socket failures reopen the socket with capped exponential backoff.
*/
class UdpRadioTransport final : public RadioTransport {
 public:
  explicit UdpRadioTransport(UdpRadioOptions options);
  ~UdpRadioTransport() override;

  UdpRadioTransport(const UdpRadioTransport&)            = delete;
  UdpRadioTransport& operator=(const UdpRadioTransport&) = delete;

  void Start(RadioEventHandler handler) override;
  void Stop() override;

  void Transmit(awacs::model::Frequency frequency, awacs::model::AudioBuffer frames, util::CancellationTokenPtr token,
                TransmitCallback done) override;

  UdpRadioStats stats() const;

 private:
  struct Job {
    awacs::model::Frequency    frequency{0};
    awacs::model::AudioBuffer  frames;
    util::CancellationTokenPtr token;
    TransmitCallback           done;
  };

  void OpenSocket();
  void CloseSocket();
  void ReopenWithBackoff();
  bool SendPacket(const RadioPacket& packet);

  void ReceiveLoop();
  void SendLoop();
  TransmitResult Play(Job& job);

  UdpRadioOptions   options_;
  RadioEventHandler handler_;

  std::mutex        socket_mutex_;
  std::atomic<int>  fd_{-1};
  std::atomic<bool> running_{false};
  std::uint32_t     sequence_{0};
  util::SteadyTime  last_hello_{};
  util::Duration    backoff_{std::chrono::seconds(1)};

  std::mutex              jobs_mutex_;
  std::condition_variable jobs_cv_;
  std::deque<Job>         jobs_;

  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> malformed_{0};
  std::atomic<std::uint64_t> sent_{0};
  std::atomic<std::uint64_t> reopens_{0};

  std::thread receive_thread_;
  std::thread send_thread_;
};

} // namespace awacs::radio
