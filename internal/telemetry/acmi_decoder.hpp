#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/model/track.hpp"
#include "internal/util/time.hpp"

namespace awacs::telemetry {

// Aircraft state at the end of a telemetry frame. last_seen is left unset.
struct TrackUpdate {
  awacs::model::AircraftTrack track;
};

struct TrackRemoval {
  awacs::model::TrackId id{0};
};

using TelemetryRecord = std::variant<TrackUpdate, TrackRemoval>;

/*
  Stateful decoder for the Tacview real-time ACMI text stream.

  ACMI sends only the properties that changed, so the decoder keeps the
  full state of every object and emits complete tracks. Updates are
  buffered per frame and emitted when the next "#<time>" line arrives
  (or on Flush()), so an object touched by several lines in one frame
  yields a single update.

  Only objects whose Type contains "Air" are emitted as tracks.
*/
class AcmiDecoder {
 public:
  explicit AcmiDecoder(awacs::model::Coalition own_coalition);

  // Joined continuation lines may not exceed this length.
  static constexpr std::size_t kMaxLogicalLineBytes = 1024 * 1024;

  // Decodes one line (without the trailing newline). Lines ending in a
  // backslash are joined with the next one. Throws util::MalformedRecord;
  // decoder state is unchanged by a rejected line, except that a joined
  // line over kMaxLogicalLineBytes is discarded whole.
  void DecodeLine(std::string_view line, std::vector<TelemetryRecord>* out);

  void Flush(std::vector<TelemetryRecord>* out);

  // Forgets all objects and reference values (new stream).
  void Reset();

  std::size_t object_count() const {
    return objects_.size();
  }

  // Tacview coalition name the controller's side appears under.
  static std::string_view TacviewCoalition(awacs::model::Coalition coalition);

 private:
  struct ObjectState {
    std::optional<double> longitude_offset;
    std::optional<double> latitude_offset;
    std::optional<double> altitude_m;
    std::optional<double> heading_deg;
    std::optional<double> ground_speed_mps;

    std::string name;
    std::string pilot;
    std::string coalition;
    std::string color;
    std::string type;
  };

  void DecodeLogicalLine(std::string_view line, std::vector<TelemetryRecord>* out);
  void DecodeFrameTime(std::string_view line, std::vector<TelemetryRecord>* out);
  void DecodeRemoval(std::string_view line, std::vector<TelemetryRecord>* out);
  void DecodeObject(std::string_view line);
  void ApplyGlobal(const std::vector<std::pair<std::string, std::string>>& properties);

  awacs::model::Side         ClassifySide(const ObjectState& state) const;
  static bool                IsAircraft(const ObjectState& state);
  std::optional<TrackUpdate> BuildUpdate(awacs::model::TrackId id, const ObjectState& state) const;

  awacs::model::Coalition own_coalition_;

  std::string pending_;

  std::optional<util::TimePoint> reference_time_;
  double                         reference_longitude_{0.0};
  double                         reference_latitude_{0.0};
  double                         frame_offset_s_{0.0};

  std::map<awacs::model::TrackId, ObjectState> objects_;
  std::set<awacs::model::TrackId>              dirty_;
};

} // namespace awacs::telemetry
