#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

#include "internal/observability/logging.hpp"

namespace awacs::runtime::config {
class RuntimeConfig;
}

namespace awacs::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string   service_name{"awacs-controller"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

#ifdef ENABLE_OTEL
// Endpoint precedence: observability.otlp_endpoint, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the local collector default for the transport.
OtlpConfig ResolveOtlpConfig(const awacs::runtime::config::RuntimeConfig& config, OtlpSignal signal);
#endif

bool InitializeTracing(const awacs::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const awacs::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  SpanScope

  One span per unit of controller work (a composition, an admin call).
  Attributes take the same LogField values the log lines use, so a call
  site tags its span and its log line with identical pilot/session keys.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name, std::initializer_list<LogField> attributes = {});
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttributes(std::initializer_list<LogField> attributes);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // result: applied | stale | malformed
  void RecordTelemetryRecord(std::string_view result);
  // outcome: replied | silent | timeout | collaborator_failure | channel_busy | disconnected | ...
  void RecordSessionOutcome(std::string_view outcome);
  void ObserveExchangeMs(std::string_view reply_kind, double duration_ms);
  void SetLiveTracks(std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const awacs::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const awacs::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view, std::initializer_list<LogField>) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttributes(std::initializer_list<LogField>) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordTelemetryRecord(std::string_view) {
}

inline void Metrics::RecordSessionOutcome(std::string_view) {
}

inline void Metrics::ObserveExchangeMs(std::string_view, double) {
}

inline void Metrics::SetLiveTracks(std::int64_t) {
}
#endif

} // namespace awacs::observability
