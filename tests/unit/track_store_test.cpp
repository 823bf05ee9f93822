#include "internal/track/track_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using awacs::model::AircraftTrack;
using awacs::model::Side;
using awacs::track::TrackStore;
using awacs::track::UpsertResult;
using namespace std::chrono_literals;

const auto kEpoch  = awacs::util::TimePoint{} + std::chrono::hours(24 * 365 * 50);
const auto kSteady = awacs::util::SteadyTime{} + std::chrono::hours(1);

AircraftTrack MakeTrack(std::uint64_t id, double lat, double lon, std::chrono::milliseconds at, std::chrono::milliseconds seen = 0ms) {
  AircraftTrack track;
  track.id                     = id;
  track.side                   = Side::kHostile;
  track.pilot                  = "Pilot " + std::to_string(id);
  track.type_name              = "MiG-29S";
  track.position.latitude_deg  = lat;
  track.position.longitude_deg = lon;
  track.position.altitude_m    = 6000.0;
  track.position.heading_deg   = 90.0;
  track.timestamp              = kEpoch + at;
  track.last_seen              = kSteady + seen;
  return track;
}

void TestUpsertIsIdempotent() {
  TrackStore store;
  auto       writer = store.OpenWriter();

  const auto track = MakeTrack(1, 42.0, 41.0, 1000ms);
  assert(writer->Upsert(track) == UpsertResult::kInserted);
  const auto once = store.Snapshot(kSteady);

  assert(writer->Upsert(track) == UpsertResult::kStale);
  const auto twice = store.Snapshot(kSteady);

  assert(once->size() == 1 && twice->size() == 1);
  assert(once->tracks()[0].position.latitude_deg == twice->tracks()[0].position.latitude_deg);
  assert(once->tracks()[0].timestamp == twice->tracks()[0].timestamp);
}

void TestOlderTimestampIsNoOp() {
  TrackStore store;
  auto       writer = store.OpenWriter();

  assert(writer->Upsert(MakeTrack(7, 42.0, 41.0, 5000ms)) == UpsertResult::kInserted);
  assert(writer->Upsert(MakeTrack(7, 43.0, 42.0, 4000ms)) == UpsertResult::kStale);

  const auto snapshot = store.Snapshot(kSteady);
  assert(snapshot->Find(7)->position.latitude_deg == 42.0);

  assert(writer->Upsert(MakeTrack(7, 42.5, 41.0, 6000ms)) == UpsertResult::kUpdated);
  assert(store.Snapshot(kSteady)->Find(7)->position.latitude_deg == 42.5);
  // The earlier snapshot is unaffected.
  assert(snapshot->Find(7)->position.latitude_deg == 42.0);
}

void TestEvictStaleRemovesExactlyExpiredTracks() {
  TrackStore store(30s);
  auto       writer = store.OpenWriter();

  writer->Upsert(MakeTrack(1, 0, 0, 1000ms, 0ms));     // age 30s: kept (not strictly older)
  writer->Upsert(MakeTrack(2, 0, 1, 1000ms, -1ms));    // age 30.001s: evicted
  writer->Upsert(MakeTrack(3, 0, 2, 1000ms, 10000ms)); // age 20s: kept

  const auto now     = kSteady + 30s;
  const auto removed = writer->EvictStale(now, 30s);
  assert(removed == 1);
  assert(store.size() == 2);

  const auto snapshot = store.Snapshot(now);
  assert(snapshot->Find(1) != nullptr);
  assert(snapshot->Find(2) == nullptr);
  assert(snapshot->Find(3) != nullptr);
}

void TestSnapshotHidesStaleTracksBeforeEviction() {
  TrackStore store(10s);
  auto       writer = store.OpenWriter();
  writer->Upsert(MakeTrack(1, 0, 0, 0ms, 0ms));
  writer->Upsert(MakeTrack(2, 0, 1, 0ms, 5s));

  const auto snapshot = store.Snapshot(kSteady + 12s);
  assert(snapshot->size() == 1);
  assert(snapshot->tracks()[0].id == 2);
  assert(store.size() == 2);
}

void TestSingleWriter() {
  TrackStore store;
  auto       writer = store.OpenWriter();
  bool       threw  = false;
  try {
    (void)store.OpenWriter();
  } catch (const awacs::util::InvalidState&) {
    threw = true;
  }
  assert(writer != nullptr);
  assert(threw && "a second writer must be refused");
}

void TestRemoveAndFindByPilot() {
  TrackStore store;
  auto       writer = store.OpenWriter();

  auto track  = MakeTrack(0x102, 42.0, 41.0, 0ms);
  track.pilot = "Enfield 1-1";
  writer->Upsert(track);

  const auto snapshot = store.Snapshot(kSteady);
  assert(snapshot->FindByPilot("enfield one one") != nullptr);
  assert(snapshot->FindByPilot("enfield 12") == nullptr);

  assert(writer->Remove(0x102));
  assert(!writer->Remove(0x102));
  assert(store.Snapshot(kSteady)->empty());
}

void TestVelocityDerivedFromDisplacement() {
  TrackStore store(30s, 10s);
  auto       writer = store.OpenWriter();

  // One degree of longitude on the equator in 100 s, heading east.
  writer->Upsert(MakeTrack(5, 0.0, 0.0, 0ms));
  writer->Upsert(MakeTrack(5, 0.0, 0.01, 10000ms));

  auto fresh = MakeTrack(6, 10.0, 10.0, 12000ms);
  writer->Upsert(fresh);

  const auto  snapshot = store.Snapshot(kSteady);
  const auto* moving   = snapshot->Find(5);
  assert(moving->velocity_east_mps > 100.0 && moving->velocity_east_mps < 120.0);
  assert(std::fabs(moving->velocity_north_mps) < 1e-6);

  // Dead-reckoned two seconds forward to the newest timestamp in the snapshot.
  const auto extrapolated = snapshot->PositionOf(*moving);
  assert(extrapolated.longitude_deg > 0.01);
  assert(extrapolated.longitude_deg < 0.0125);
}

void TestConcurrentReadersSeeConsistentSnapshots() {
  TrackStore store(std::chrono::hours(1));
  auto       writer = store.OpenWriter();

  std::atomic<bool> done{false};
  std::atomic<int>  violations{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      while (!done.load()) {
        const auto snapshot = store.Snapshot(kSteady);
        // Batches write ids in ascending order, so a snapshot taken mid-batch
        // sees latitudes that never rise with id and span at most one step.
        const auto& tracks = snapshot->tracks();
        if (!tracks.empty()) {
          const double first = tracks.front().position.latitude_deg;
          for (const auto& track : tracks) {
            const double lat = track.position.latitude_deg;
            if (lat > first + 1e-12 || first - lat > 0.0015) {
              violations.fetch_add(1);
            }
          }
        }
        for (std::size_t i = 1; i < snapshot->tracks().size(); ++i) {
          if (snapshot->tracks()[i - 1].id >= snapshot->tracks()[i].id) {
            violations.fetch_add(1);
          }
        }
      }
    });
  }

  for (int step = 1; step <= 500; ++step) {
    for (std::uint64_t id = 1; id <= 8; ++id) {
      writer->Upsert(MakeTrack(id, step * 0.001, 0.0, std::chrono::milliseconds(step)));
    }
  }
  done = true;
  for (auto& reader : readers) {
    reader.join();
  }

  assert(violations.load() == 0);
  assert(store.size() == 8);
}

} // namespace

int main() {
  TestUpsertIsIdempotent();
  TestOlderTimestampIsNoOp();
  TestEvictStaleRemovesExactlyExpiredTracks();
  TestSnapshotHidesStaleTracksBeforeEviction();
  TestSingleWriter();
  TestRemoveAndFindByPilot();
  TestVelocityDerivedFromDisplacement();
  TestConcurrentReadersSeeConsistentSnapshots();

  std::cout << "awacs_unit_track_store: pass\n";
  return 0;
}
