#include "internal/config/settings.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "internal/util/errors.hpp"

namespace awacs::config {

namespace {

using awacs::util::InvalidConfig;

std::uint16_t ToPort(std::uint32_t value, std::uint16_t fallback, const char* field) {
  if (value == 0) {
    return fallback;
  }
  if (value > std::numeric_limits<std::uint16_t>::max()) {
    throw InvalidConfig(std::string(field) + " out of range: " + std::to_string(value));
  }
  return static_cast<std::uint16_t>(value);
}

std::string OrDefault(const std::string& value, const std::string& fallback) {
  return value.empty() ? fallback : value;
}

void RequirePositive(Duration value, const char* field) {
  if (value.count() <= 0) {
    throw InvalidConfig(std::string(field) + " must be positive");
  }
}

} // namespace

Settings ToSettings(const awacs::runtime::config::RuntimeConfig& config) {
  using awacs::util::FromProto;
  namespace pb = awacs::runtime::config;

  Settings settings;

  // ---------------- controller ----------------
  const auto& controller        = config.controller();
  settings.controller.callsign  = OrDefault(controller.callsign(), settings.controller.callsign);
  settings.controller.coalition = controller.coalition() == pb::COALITION_RED ? awacs::model::Coalition::kRed : awacs::model::Coalition::kBlue;
  if (settings.controller.callsign.find(',') != std::string::npos) {
    throw InvalidConfig("controller.callsign must not contain ','");
  }

  // ---------------- telemetry ----------------
  const auto& telemetry = config.telemetry();
  auto&       t         = settings.telemetry;
  t.host                = OrDefault(telemetry.host(), t.host);
  t.port                = ToPort(telemetry.port(), t.port, "telemetry.port");
  t.username            = OrDefault(telemetry.username(), t.username);
  t.password_hash       = OrDefault(telemetry.password_hash(), t.password_hash);

  t.reconnect_initial_backoff = FromProto(telemetry.reconnect_initial_backoff(), t.reconnect_initial_backoff);
  t.reconnect_max_backoff     = FromProto(telemetry.reconnect_max_backoff(), t.reconnect_max_backoff);
  t.staleness_window          = FromProto(telemetry.staleness_window(), t.staleness_window);
  t.eviction_interval         = FromProto(telemetry.eviction_interval(), t.eviction_interval);
  t.max_extrapolation         = FromProto(telemetry.max_extrapolation(), t.max_extrapolation);

  RequirePositive(t.reconnect_initial_backoff, "telemetry.reconnect_initial_backoff");
  RequirePositive(t.staleness_window, "telemetry.staleness_window");
  RequirePositive(t.eviction_interval, "telemetry.eviction_interval");
  if (t.reconnect_max_backoff < t.reconnect_initial_backoff) {
    throw InvalidConfig("telemetry.reconnect_max_backoff must be >= reconnect_initial_backoff");
  }
  if (t.max_extrapolation.count() < 0) {
    throw InvalidConfig("telemetry.max_extrapolation must not be negative");
  }

  // ---------------- radio ----------------
  const auto& radio = config.radio();
  auto&       r     = settings.radio;
  r.bind_address    = OrDefault(radio.bind_address(), r.bind_address);
  r.bind_port       = ToPort(radio.bind_port(), r.bind_port, "radio.bind_port");
  r.server_address  = OrDefault(radio.server_address(), r.server_address);
  r.server_port     = ToPort(radio.server_port(), r.server_port, "radio.server_port");
  r.unit_name       = OrDefault(radio.unit_name(), r.unit_name);

  r.reconnect_max_backoff = FromProto(radio.reconnect_max_backoff(), r.reconnect_max_backoff);
  RequirePositive(r.reconnect_max_backoff, "radio.reconnect_max_backoff");

  for (auto frequency : radio.frequencies()) {
    if (frequency == 0) {
      throw InvalidConfig("radio.frequencies must not contain 0");
    }
    if (std::find(r.frequencies.begin(), r.frequencies.end(), frequency) == r.frequencies.end()) {
      r.frequencies.push_back(frequency);
    }
  }
  if (r.frequencies.empty()) {
    throw InvalidConfig("radio.frequencies must list at least one frequency");
  }

  // ---------------- calls ----------------
  if (config.calls().bogey_dope_search_radius_nm() < 0.0) {
    throw InvalidConfig("calls.bogey_dope_search_radius_nm must not be negative");
  }
  if (config.calls().bogey_dope_search_radius_nm() > 0.0) {
    settings.calls.search_radius_nm = config.calls().bogey_dope_search_radius_nm();
  }

  // ---------------- sessions ----------------
  const auto& sessions = config.sessions();
  auto&       s        = settings.sessions;

  s.max_transmission      = FromProto(sessions.max_transmission(), s.max_transmission);
  s.transcription_timeout = FromProto(sessions.transcription_timeout(), s.transcription_timeout);
  s.composition_timeout   = FromProto(sessions.composition_timeout(), s.composition_timeout);
  s.synthesis_timeout     = FromProto(sessions.synthesis_timeout(), s.synthesis_timeout);
  s.channel_wait_timeout  = FromProto(sessions.channel_wait_timeout(), s.channel_wait_timeout);
  s.transmit_timeout      = FromProto(sessions.transmit_timeout(), s.transmit_timeout);
  s.tick_interval         = FromProto(sessions.tick_interval(), s.tick_interval);
  s.language              = OrDefault(sessions.language(), s.language);
  if (sessions.transcription_attempts() != 0) {
    s.transcription_attempts = sessions.transcription_attempts();
  }

  RequirePositive(s.max_transmission, "sessions.max_transmission");
  RequirePositive(s.transcription_timeout, "sessions.transcription_timeout");
  RequirePositive(s.composition_timeout, "sessions.composition_timeout");
  RequirePositive(s.synthesis_timeout, "sessions.synthesis_timeout");
  RequirePositive(s.channel_wait_timeout, "sessions.channel_wait_timeout");
  RequirePositive(s.transmit_timeout, "sessions.transmit_timeout");
  RequirePositive(s.tick_interval, "sessions.tick_interval");

  // ---------------- speech ----------------
  const auto& speech              = config.speech();
  settings.speech.gateway_address = speech.gateway_address();
  settings.speech.api_key         = speech.api_key();
  settings.speech.voice           = OrDefault(speech.voice(), settings.speech.voice);
  if (speech.speed() < 0.0 || speech.speed() > 4.0) {
    throw InvalidConfig("speech.speed must be within [0, 4]");
  }
  if (speech.speed() > 0.0) {
    settings.speech.speed = speech.speed();
  }
  if (speech.max_concurrent_calls() != 0) {
    settings.speech.max_concurrent_calls = speech.max_concurrent_calls();
  }

  // ---------------- workers / admin ----------------
  if (config.workers().threads() != 0) {
    settings.worker_threads = config.workers().threads();
  }
  settings.admin_bind_address = config.admin().bind_address();

  return settings;
}

} // namespace awacs::config
