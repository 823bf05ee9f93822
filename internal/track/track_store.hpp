#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/track.hpp"
#include "internal/util/time.hpp"

namespace awacs::track {

using awacs::model::AircraftTrack;
using awacs::model::TrackId;

/*
  Immutable point-in-time copy of the store. Sorted by track id.

  Positions are dead-reckoned to the newest source timestamp in the
  snapshot so every track is compared at the same instant.
*/
class TrackSnapshot {
 public:
  TrackSnapshot(std::vector<AircraftTrack> tracks, util::Duration max_extrapolation);

  const std::vector<AircraftTrack>& tracks() const {
    return tracks_;
  }

  std::size_t size() const {
    return tracks_.size();
  }

  bool empty() const {
    return tracks_.empty();
  }

  util::TimePoint latest_timestamp() const {
    return latest_timestamp_;
  }

  const AircraftTrack* Find(TrackId id) const;

  // Compares normalized callsigns; first match by id order.
  const AircraftTrack* FindByPilot(std::string_view callsign) const;

  awacs::model::Position PositionOf(const AircraftTrack& track) const;

 private:
  std::vector<AircraftTrack> tracks_;
  util::TimePoint            latest_timestamp_{};
  util::Duration             max_extrapolation_;
};

using TrackSnapshotPtr = std::shared_ptr<const TrackSnapshot>;

enum class UpsertResult {
  kInserted,
  kUpdated,
  kStale, // timestamp not newer than the stored one; store unchanged
};

class TrackWriter;

/*
  Shared aircraft model.

  Many concurrent readers take snapshots; exactly one writer (the
  telemetry ingestor) holds the TrackWriter handle.
*/
class TrackStore {
 public:
  explicit TrackStore(util::Duration staleness_window = std::chrono::seconds(30), util::Duration max_extrapolation = std::chrono::seconds(10));

  // Tracks seen within the staleness window as of now.
  TrackSnapshotPtr Snapshot() const;
  TrackSnapshotPtr Snapshot(util::SteadyTime now) const;

  // Throws util::InvalidState if a writer was already handed out.
  std::unique_ptr<TrackWriter> OpenWriter();

  std::size_t size() const;

 private:
  friend class TrackWriter;

  UpsertResult Upsert(AircraftTrack track);
  bool         Remove(TrackId id);
  std::size_t  EvictStale(util::SteadyTime now, util::Duration window);

  const util::Duration staleness_window_;
  const util::Duration max_extrapolation_;

  mutable std::shared_mutex                  mutex_;
  std::unordered_map<TrackId, AircraftTrack> tracks_;
  std::atomic<bool>                          writer_open_{false};
};

class TrackWriter {
 public:
  UpsertResult Upsert(const AircraftTrack& track);
  bool         Remove(TrackId id);

  // Removes tracks with now - last_seen > window. Returns the number removed.
  std::size_t EvictStale(util::SteadyTime now, util::Duration window);

 private:
  friend class TrackStore;
  explicit TrackWriter(TrackStore* store) : store_(store) {
  }

  TrackStore* store_;
};

} // namespace awacs::track
