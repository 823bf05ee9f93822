#include "internal/telemetry/telemetry_ingestor.hpp"

#include <algorithm>
#include <utility>
#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace awacs::telemetry {

using awacs::observability::BoolField;
using awacs::observability::IntField;
using awacs::observability::StringField;
using awacs::observability::UintField;

TelemetryIngestor::TelemetryIngestor(std::shared_ptr<track::TrackStore> store, std::unique_ptr<TelemetrySource> source,
                                     awacs::model::Coalition own_coalition, IngestorOptions options)
    : store_(std::move(store)),
      writer_(store_->OpenWriter()),
      source_(std::move(source)),
      decoder_(own_coalition),
      options_(options),
      backoff_(options.reconnect_initial_backoff) {
}

TelemetryIngestor::~TelemetryIngestor() {
  Stop();
}

void TelemetryIngestor::Start() {
  if (running_.exchange(true)) {
    return;
  }
  next_maintenance_ = util::SteadyNow() + options_.eviction_interval;
  thread_           = std::thread(&TelemetryIngestor::Loop, this);
  AWACS_LOG_INFO("telemetry ingestor started", {StringField("source", source_->Describe())});
}

void TelemetryIngestor::Stop() {
  {
    std::lock_guard lock(wait_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  wait_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  source_->Close();
  connected_ = false;
  AWACS_LOG_INFO("telemetry ingestor stopped");
}

// ------------------------------------------------------------
// Feed processing
// ------------------------------------------------------------

void TelemetryIngestor::ProcessLine(std::string_view line, util::SteadyTime received) {
  std::vector<TelemetryRecord> records;
  try {
    decoder_.DecodeLine(line, &records);
  } catch (const util::MalformedRecord& e) {
    malformed_.fetch_add(1, std::memory_order_relaxed);
    observability::Metrics::Instance().RecordTelemetryRecord("malformed");
    AWACS_LOG_DEBUG("skipping malformed telemetry record", {StringField("reason", e.what())});
  }
  // Records decoded before a rejected line in the same frame still apply.
  Apply(records, received);
}

void TelemetryIngestor::FlushFrame(util::SteadyTime received) {
  std::vector<TelemetryRecord> records;
  decoder_.Flush(&records);
  Apply(records, received);
}

void TelemetryIngestor::Apply(std::vector<TelemetryRecord>& records, util::SteadyTime received) {
  for (auto& record : records) {
    if (auto* update = std::get_if<TrackUpdate>(&record)) {
      update->track.last_seen = received;
      const auto result       = writer_->Upsert(update->track);
      if (result == track::UpsertResult::kStale) {
        stale_.fetch_add(1, std::memory_order_relaxed);
        observability::Metrics::Instance().RecordTelemetryRecord("stale");
      } else {
        applied_.fetch_add(1, std::memory_order_relaxed);
        observability::Metrics::Instance().RecordTelemetryRecord("applied");
      }
      continue;
    }

    const auto& removal = std::get<TrackRemoval>(record);
    if (writer_->Remove(removal.id)) {
      removed_.fetch_add(1, std::memory_order_relaxed);
    }
  }
}

void TelemetryIngestor::RunMaintenance(util::SteadyTime now) {
  const auto evicted = writer_->EvictStale(now, options_.staleness_window);
  if (evicted > 0) {
    evicted_.fetch_add(evicted, std::memory_order_relaxed);
    AWACS_LOG_DEBUG("evicted stale tracks", {UintField("count", evicted)});
  }
  observability::Metrics::Instance().SetLiveTracks(static_cast<std::int64_t>(store_->size()));
}

IngestorStats TelemetryIngestor::stats() const {
  IngestorStats stats;
  stats.records_applied   = applied_.load();
  stats.records_stale     = stale_.load();
  stats.records_malformed = malformed_.load();
  stats.tracks_removed    = removed_.load();
  stats.tracks_evicted    = evicted_.load();
  stats.reconnects        = reconnects_.load();
  stats.connected         = connected_.load();
  return stats;
}

// ------------------------------------------------------------
// Connection loop
// ------------------------------------------------------------

void TelemetryIngestor::Loop() {
  while (running_) {
    if (!connected_ && !TryConnect()) {
      WaitFor(backoff_);
      backoff_ = std::min(backoff_ * 2, options_.reconnect_max_backoff);
      continue;
    }

    ReadOnce();
    MaybeRunMaintenance();
  }
}

bool TelemetryIngestor::TryConnect() {
  observability::SpanScope span("awacs.telemetry.connect", {StringField("source", source_->Describe())});
  try {
    source_->Connect();
  } catch (const util::TransportDisconnected& e) {
    span.RecordException(e.what());
    reconnects_.fetch_add(1, std::memory_order_relaxed);
    AWACS_LOG_WARN("telemetry connect failed",
                   {StringField("source", source_->Describe()), StringField("reason", e.what()), IntField("retry_in_ms", backoff_.count())});
    return false;
  }

  // The server replays the header and full object state on every connection.
  decoder_.Reset();
  backoff_   = options_.reconnect_initial_backoff;
  connected_ = true;
  AWACS_LOG_INFO("telemetry connected", {StringField("source", source_->Describe())});
  return true;
}

void TelemetryIngestor::ReadOnce() {
  try {
    auto line = source_->ReadLine(options_.read_timeout);
    if (line) {
      ProcessLine(*line, util::SteadyNow());
    }
  } catch (const util::TransportDisconnected& e) {
    connected_ = false;
    FlushFrame(util::SteadyNow());
    AWACS_LOG_WARN("telemetry link lost", {StringField("source", source_->Describe()), StringField("reason", e.what()),
                                           BoolField("tracks_retained", true)});
  }
}

void TelemetryIngestor::WaitFor(util::Duration duration) {
  const auto deadline = util::SteadyNow() + duration;
  while (running_) {
    const auto now = util::SteadyNow();
    if (now >= deadline) {
      return;
    }
    const auto slice = std::min<util::SteadyClock::duration>(deadline - now, options_.eviction_interval);
    {
      std::unique_lock lock(wait_mutex_);
      wait_cv_.wait_for(lock, slice, [&] { return !running_.load(); });
    }
    MaybeRunMaintenance();
  }
}

void TelemetryIngestor::MaybeRunMaintenance() {
  const auto now = util::SteadyNow();
  if (now < next_maintenance_) {
    return;
  }
  next_maintenance_ = now + options_.eviction_interval;
  RunMaintenance(now);
}

} // namespace awacs::telemetry
