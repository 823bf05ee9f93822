#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/radio.hpp"
#include "internal/model/track.hpp"
#include "internal/util/time.hpp"

namespace awacs::config {

using awacs::util::Duration;

struct ControllerSettings {
  std::string             callsign{"overlord"};
  awacs::model::Coalition coalition{awacs::model::Coalition::kBlue};
};

struct TelemetrySettings {
  std::string   host{"127.0.0.1"};
  std::uint16_t port{42674};
  std::string   username{"awacs"};
  std::string   password_hash{"0"};

  Duration reconnect_initial_backoff{std::chrono::seconds(1)};
  Duration reconnect_max_backoff{std::chrono::seconds(30)};
  Duration staleness_window{std::chrono::seconds(30)};
  Duration eviction_interval{std::chrono::seconds(1)};
  Duration max_extrapolation{std::chrono::seconds(10)};
};

struct RadioSettings {
  std::string   bind_address{"0.0.0.0"};
  std::uint16_t bind_port{5003};
  std::string   server_address{"127.0.0.1"};
  std::uint16_t server_port{5002};

  std::vector<awacs::model::Frequency> frequencies;
  std::string                          unit_name{"AWACS"};

  Duration reconnect_max_backoff{std::chrono::seconds(30)};
};

struct CallSettings {
  double search_radius_nm{160.0};
};

struct SessionSettings {
  Duration max_transmission{std::chrono::seconds(20)};
  Duration transcription_timeout{std::chrono::seconds(15)};
  Duration composition_timeout{std::chrono::seconds(5)};
  Duration synthesis_timeout{std::chrono::seconds(15)};
  Duration channel_wait_timeout{std::chrono::seconds(20)};
  Duration transmit_timeout{std::chrono::seconds(60)};
  Duration tick_interval{std::chrono::milliseconds(100)};

  std::uint32_t transcription_attempts{2};
  std::string   language{"en"};
};

struct SpeechSettings {
  std::string gateway_address;
  std::string api_key;
  std::string voice{"alloy"};
  double      speed{1.0};

  std::uint32_t max_concurrent_calls{16};
};

/*
  Validated settings handed to the core. Built once at startup by
  ToSettings(); nothing below the composition root reads RuntimeConfig.
*/
struct Settings {
  ControllerSettings controller;
  TelemetrySettings  telemetry;
  RadioSettings      radio;
  CallSettings       calls;
  SessionSettings    sessions;
  SpeechSettings     speech;

  std::uint32_t worker_threads{4};
  std::string   admin_bind_address;
};

// Throws util::InvalidConfig on out-of-range or inconsistent values.
Settings ToSettings(const awacs::runtime::config::RuntimeConfig& config);

} // namespace awacs::config
