#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

#include "internal/model/track.hpp"
#include "internal/telemetry/acmi_decoder.hpp"
#include "internal/telemetry/telemetry_source.hpp"
#include "internal/track/track_store.hpp"
#include "internal/util/time.hpp"

namespace awacs::telemetry {

struct IngestorOptions {
  util::Duration staleness_window{std::chrono::seconds(30)};
  util::Duration eviction_interval{std::chrono::seconds(1)};
  util::Duration reconnect_initial_backoff{std::chrono::seconds(1)};
  util::Duration reconnect_max_backoff{std::chrono::seconds(30)};
  util::Duration read_timeout{std::chrono::milliseconds(200)};
};

struct IngestorStats {
  std::uint64_t records_applied{0};
  std::uint64_t records_stale{0};
  std::uint64_t records_malformed{0};
  std::uint64_t tracks_removed{0};
  std::uint64_t tracks_evicted{0};
  std::uint64_t reconnects{0};
  bool          connected{false};
};

/*
  Keeps the track store in sync with the telemetry feed.

  Owns the store's only writer. Runs one thread that reads lines, decodes
  them and upserts tracks; on link loss it reconnects with capped
  exponential backoff and keeps evicting stale tracks meanwhile. The
  store is never cleared on reconnect.
*/
class TelemetryIngestor {
 public:
  TelemetryIngestor(std::shared_ptr<track::TrackStore> store, std::unique_ptr<TelemetrySource> source, awacs::model::Coalition own_coalition,
                    IngestorOptions options);
  ~TelemetryIngestor();

  TelemetryIngestor(const TelemetryIngestor&)            = delete;
  TelemetryIngestor& operator=(const TelemetryIngestor&) = delete;

  void Start();
  void Stop();

  // Decodes and applies one feed line. Malformed lines are counted and skipped.
  void ProcessLine(std::string_view line, util::SteadyTime received);

  // Emits records buffered for the current frame.
  void FlushFrame(util::SteadyTime received);

  // Evicts tracks not seen within the staleness window.
  void RunMaintenance(util::SteadyTime now);

  IngestorStats stats() const;

 private:
  void Loop();
  bool TryConnect();
  void ReadOnce();
  void WaitFor(util::Duration duration);
  void MaybeRunMaintenance();
  void Apply(std::vector<TelemetryRecord>& records, util::SteadyTime received);

  std::shared_ptr<track::TrackStore>  store_;
  std::unique_ptr<track::TrackWriter> writer_;
  std::unique_ptr<TelemetrySource>    source_;
  AcmiDecoder                         decoder_;
  IngestorOptions                     options_;

  util::SteadyTime next_maintenance_{};
  util::Duration   backoff_;

  std::atomic<std::uint64_t> applied_{0};
  std::atomic<std::uint64_t> stale_{0};
  std::atomic<std::uint64_t> malformed_{0};
  std::atomic<std::uint64_t> removed_{0};
  std::atomic<std::uint64_t> evicted_{0};
  std::atomic<std::uint64_t> reconnects_{0};
  std::atomic<bool>          connected_{false};

  std::mutex              wait_mutex_;
  std::condition_variable wait_cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace awacs::telemetry
