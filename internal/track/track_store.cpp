#include "internal/track/track_store.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <numbers>

#include "internal/geometry/geometry.hpp"
#include "internal/model/callsign.hpp"
#include "internal/util/errors.hpp"

namespace awacs::track {

namespace {

constexpr double kDegToRad = std::numbers::pi / 180.0;

// Fills velocity from reported speed and heading, or from displacement
// since the previous fix when the feed does not report speed.
void DeriveVelocity(const AircraftTrack* previous, AircraftTrack& track) {
  auto& pos = track.position;

  if (pos.ground_speed_mps <= 0.0 && previous != nullptr) {
    const double dt = std::chrono::duration<double>(track.timestamp - previous->timestamp).count();
    if (dt > 0.0) {
      const double mean_lat = (pos.latitude_deg + previous->position.latitude_deg) / 2.0 * kDegToRad;
      const double north    = (pos.latitude_deg - previous->position.latitude_deg) * kDegToRad * geometry::kEarthRadiusM;
      const double east = std::remainder(pos.longitude_deg - previous->position.longitude_deg, 360.0) * kDegToRad * geometry::kEarthRadiusM *
                          std::cos(mean_lat);

      track.velocity_north_mps = north / dt;
      track.velocity_east_mps  = east / dt;
      pos.ground_speed_mps     = std::hypot(track.velocity_north_mps, track.velocity_east_mps);
      return;
    }
    track.velocity_north_mps = previous->velocity_north_mps;
    track.velocity_east_mps  = previous->velocity_east_mps;
    pos.ground_speed_mps     = previous->position.ground_speed_mps;
    return;
  }

  const double heading     = pos.heading_deg * kDegToRad;
  track.velocity_north_mps = pos.ground_speed_mps * std::cos(heading);
  track.velocity_east_mps  = pos.ground_speed_mps * std::sin(heading);
}

} // namespace

// ------------------------------------------------------------
// TrackSnapshot
// ------------------------------------------------------------

TrackSnapshot::TrackSnapshot(std::vector<AircraftTrack> tracks, util::Duration max_extrapolation)
    : tracks_(std::move(tracks)), max_extrapolation_(max_extrapolation) {
  std::sort(tracks_.begin(), tracks_.end(), [](const AircraftTrack& a, const AircraftTrack& b) { return a.id < b.id; });
  for (const auto& track : tracks_) {
    latest_timestamp_ = std::max(latest_timestamp_, track.timestamp);
  }
}

const AircraftTrack* TrackSnapshot::Find(TrackId id) const {
  auto it = std::lower_bound(tracks_.begin(), tracks_.end(), id, [](const AircraftTrack& t, TrackId value) { return t.id < value; });
  if (it == tracks_.end() || it->id != id) {
    return nullptr;
  }
  return &*it;
}

const AircraftTrack* TrackSnapshot::FindByPilot(std::string_view callsign) const {
  const auto wanted = awacs::model::NormalizeCallsign(callsign);
  if (wanted.empty()) {
    return nullptr;
  }
  for (const auto& track : tracks_) {
    if (!track.pilot.empty() && awacs::model::NormalizeCallsign(track.pilot) == wanted) {
      return &track;
    }
  }
  return nullptr;
}

awacs::model::Position TrackSnapshot::PositionOf(const AircraftTrack& track) const {
  return track.PositionAt(latest_timestamp_, max_extrapolation_);
}

// ------------------------------------------------------------
// TrackStore
// ------------------------------------------------------------

TrackStore::TrackStore(util::Duration staleness_window, util::Duration max_extrapolation)
    : staleness_window_(staleness_window), max_extrapolation_(max_extrapolation) {
}

TrackSnapshotPtr TrackStore::Snapshot() const {
  return Snapshot(util::SteadyNow());
}

TrackSnapshotPtr TrackStore::Snapshot(util::SteadyTime now) const {
  std::vector<AircraftTrack> copy;
  {
    std::shared_lock lock(mutex_);
    copy.reserve(tracks_.size());
    for (const auto& [id, track] : tracks_) {
      if (now - track.last_seen <= staleness_window_) {
        copy.push_back(track);
      }
    }
  }
  return std::make_shared<const TrackSnapshot>(std::move(copy), max_extrapolation_);
}

std::unique_ptr<TrackWriter> TrackStore::OpenWriter() {
  if (writer_open_.exchange(true)) {
    throw util::InvalidState("track store writer already open");
  }
  return std::unique_ptr<TrackWriter>(new TrackWriter(this));
}

std::size_t TrackStore::size() const {
  std::shared_lock lock(mutex_);
  return tracks_.size();
}

UpsertResult TrackStore::Upsert(AircraftTrack track) {
  std::unique_lock lock(mutex_);

  auto it = tracks_.find(track.id);
  if (it == tracks_.end()) {
    DeriveVelocity(nullptr, track);
    tracks_.emplace(track.id, std::move(track));
    return UpsertResult::kInserted;
  }

  if (track.timestamp <= it->second.timestamp) {
    return UpsertResult::kStale;
  }

  DeriveVelocity(&it->second, track);
  it->second = std::move(track);
  return UpsertResult::kUpdated;
}

bool TrackStore::Remove(TrackId id) {
  std::unique_lock lock(mutex_);
  return tracks_.erase(id) > 0;
}

std::size_t TrackStore::EvictStale(util::SteadyTime now, util::Duration window) {
  std::unique_lock lock(mutex_);
  return std::erase_if(tracks_, [&](const auto& entry) { return now - entry.second.last_seen > window; });
}

// ------------------------------------------------------------
// TrackWriter
// ------------------------------------------------------------

UpsertResult TrackWriter::Upsert(const AircraftTrack& track) {
  return store_->Upsert(track);
}

bool TrackWriter::Remove(TrackId id) {
  return store_->Remove(id);
}

std::size_t TrackWriter::EvictStale(util::SteadyTime now, util::Duration window) {
  return store_->EvictStale(now, window);
}

} // namespace awacs::track
