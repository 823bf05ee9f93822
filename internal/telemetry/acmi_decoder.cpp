#include "internal/telemetry/acmi_decoder.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace awacs::telemetry {

using awacs::model::Coalition;
using awacs::model::Side;
using awacs::model::TrackId;
using awacs::util::MalformedRecord;

namespace {

using Properties = std::vector<std::pair<std::string, std::string>>;

std::string Lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool ParseDouble(std::string_view text, double* out) {
  if (text.empty()) {
    return false;
  }
  std::string copy(text);
  char*       end   = nullptr;
  const double value = std::strtod(copy.c_str(), &end);
  if (end == nullptr || *end != '\0' || !std::isfinite(value)) {
    return false;
  }
  *out = value;
  return true;
}

TrackId ParseObjectId(std::string_view text) {
  TrackId id = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id, 16);
  if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
    throw MalformedRecord("invalid object id '" + std::string(text) + "'");
  }
  return id;
}

// Splits "a=1,b=x\,y" on unescaped commas, unescaping "\," in values.
std::vector<std::string> SplitUnescaped(std::string_view line) {
  std::vector<std::string> parts;
  std::string              current;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '\\' && i + 1 < line.size()) {
      current.push_back(line[++i]);
      continue;
    }
    if (c == ',') {
      parts.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  parts.push_back(std::move(current));
  return parts;
}

Properties ParseProperties(const std::vector<std::string>& parts) {
  Properties properties;
  for (std::size_t i = 1; i < parts.size(); ++i) {
    const auto& part = parts[i];
    const auto  eq   = part.find('=');
    if (eq == std::string::npos || eq == 0) {
      throw MalformedRecord("property without key=value: '" + part + "'");
    }
    properties.emplace_back(part.substr(0, eq), part.substr(eq + 1));
  }
  return properties;
}

std::vector<std::string_view> SplitPipe(std::string_view text) {
  std::vector<std::string_view> fields;
  std::size_t                   start = 0;
  while (true) {
    const auto bar = text.find('|', start);
    if (bar == std::string_view::npos) {
      fields.push_back(text.substr(start));
      break;
    }
    fields.push_back(text.substr(start, bar - start));
    start = bar + 1;
  }
  return fields;
}

std::optional<double> TransformField(const std::vector<std::string_view>& fields, std::size_t index) {
  if (index >= fields.size() || fields[index].empty()) {
    return std::nullopt;
  }
  double value = 0.0;
  if (!ParseDouble(fields[index], &value)) {
    throw MalformedRecord("invalid transform field '" + std::string(fields[index]) + "'");
  }
  return value;
}

} // namespace

AcmiDecoder::AcmiDecoder(Coalition own_coalition) : own_coalition_(own_coalition) {
}

std::string_view AcmiDecoder::TacviewCoalition(Coalition coalition) {
  return coalition == Coalition::kBlue ? "Enemies" : "Allies";
}

void AcmiDecoder::Reset() {
  pending_.clear();
  reference_time_.reset();
  reference_longitude_ = 0.0;
  reference_latitude_  = 0.0;
  frame_offset_s_      = 0.0;
  objects_.clear();
  dirty_.clear();
}

void AcmiDecoder::DecodeLine(std::string_view line, std::vector<TelemetryRecord>* out) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }

  if (!pending_.empty() && pending_.size() + line.size() > kMaxLogicalLineBytes) {
    pending_.clear();
    throw MalformedRecord("continued line longer than " + std::to_string(kMaxLogicalLineBytes) + " bytes");
  }

  if (!line.empty() && line.back() == '\\') {
    pending_.append(line.substr(0, line.size() - 1));
    pending_.push_back('\n');
    return;
  }

  if (!pending_.empty()) {
    std::string joined = std::move(pending_);
    pending_.clear();
    joined.append(line);
    DecodeLogicalLine(joined, out);
    return;
  }

  DecodeLogicalLine(line, out);
}

void AcmiDecoder::DecodeLogicalLine(std::string_view line, std::vector<TelemetryRecord>* out) {
  static constexpr std::string_view kBom = "\xEF\xBB\xBF";
  if (line.substr(0, kBom.size()) == kBom) {
    line.remove_prefix(kBom.size());
  }

  if (line.empty() || line.substr(0, 2) == "//") {
    return;
  }

  if (line.substr(0, 9) == "FileType=" || line.substr(0, 12) == "FileVersion=") {
    return;
  }

  switch (line.front()) {
    case '#':
      DecodeFrameTime(line, out);
      return;
    case '-':
      DecodeRemoval(line, out);
      return;
    default:
      DecodeObject(line);
      return;
  }
}

void AcmiDecoder::DecodeFrameTime(std::string_view line, std::vector<TelemetryRecord>* out) {
  double offset = 0.0;
  if (!ParseDouble(line.substr(1), &offset)) {
    throw MalformedRecord("invalid frame time '" + std::string(line) + "'");
  }
  Flush(out);
  frame_offset_s_ = offset;
}

void AcmiDecoder::DecodeRemoval(std::string_view line, std::vector<TelemetryRecord>* out) {
  const auto id = ParseObjectId(line.substr(1));
  dirty_.erase(id);
  auto it = objects_.find(id);
  if (it == objects_.end()) {
    return;
  }
  const bool was_aircraft = IsAircraft(it->second);
  objects_.erase(it);
  if (was_aircraft) {
    out->push_back(TrackRemoval{id});
  }
}

void AcmiDecoder::DecodeObject(std::string_view line) {
  const auto parts = SplitUnescaped(line);
  const auto id    = ParseObjectId(parts.front());
  const auto props = ParseProperties(parts);

  if (id == 0) {
    ApplyGlobal(props);
    return;
  }

  // Work on a copy so a rejected line leaves the object untouched.
  ObjectState state;
  auto        existing = objects_.find(id);
  if (existing != objects_.end()) {
    state = existing->second;
  }

  for (const auto& [key, value] : props) {
    if (key == "T") {
      const auto fields = SplitPipe(value);
      const auto count  = fields.size();
      if (count != 3 && count != 5 && count != 6 && count != 9) {
        throw MalformedRecord("transform with " + std::to_string(count) + " fields");
      }

      if (auto v = TransformField(fields, 0)) {
        state.longitude_offset = *v;
      }
      if (auto v = TransformField(fields, 1)) {
        state.latitude_offset = *v;
      }
      if (auto v = TransformField(fields, 2)) {
        state.altitude_m = *v;
      }
      // lon|lat|alt|roll|pitch|yaw: yaw is the best heading available.
      if (count == 6) {
        if (auto v = TransformField(fields, 5)) {
          state.heading_deg = *v;
        }
      }
      if (count == 9) {
        if (auto v = TransformField(fields, 8)) {
          state.heading_deg = *v;
        } else if (auto yaw = TransformField(fields, 5)) {
          state.heading_deg = *yaw;
        }
      }
    } else if (key == "Name") {
      state.name = value;
    } else if (key == "Pilot") {
      state.pilot = value;
    } else if (key == "Coalition") {
      state.coalition = value;
    } else if (key == "Color") {
      state.color = value;
    } else if (key == "Type") {
      state.type = value;
    } else if (key == "IAS" || key == "TAS" || key == "GS") {
      // GS wins over airspeeds when both are present.
      double speed = 0.0;
      if (!ParseDouble(value, &speed) || speed < 0.0) {
        throw MalformedRecord("invalid " + key + " '" + value + "'");
      }
      if (key == "GS" || !state.ground_speed_mps) {
        state.ground_speed_mps = speed;
      }
    }
  }

  objects_[id] = std::move(state);
  dirty_.insert(id);
}

void AcmiDecoder::ApplyGlobal(const Properties& properties) {
  for (const auto& [key, value] : properties) {
    if (key == "ReferenceTime") {
      util::TimePoint parsed;
      if (!util::ParseIso8601(value, &parsed)) {
        throw MalformedRecord("invalid ReferenceTime '" + value + "'");
      }
      reference_time_ = parsed;
    } else if (key == "ReferenceLongitude") {
      if (!ParseDouble(value, &reference_longitude_)) {
        throw MalformedRecord("invalid ReferenceLongitude '" + value + "'");
      }
    } else if (key == "ReferenceLatitude") {
      if (!ParseDouble(value, &reference_latitude_)) {
        throw MalformedRecord("invalid ReferenceLatitude '" + value + "'");
      }
    }
  }
}

void AcmiDecoder::Flush(std::vector<TelemetryRecord>* out) {
  for (auto id : dirty_) {
    auto it = objects_.find(id);
    if (it == objects_.end()) {
      continue;
    }
    if (auto update = BuildUpdate(id, it->second)) {
      out->push_back(std::move(*update));
    }
  }
  dirty_.clear();
}

bool AcmiDecoder::IsAircraft(const ObjectState& state) {
  return state.type.find("Air") != std::string::npos;
}

Side AcmiDecoder::ClassifySide(const ObjectState& state) const {
  const auto own   = Lower(TacviewCoalition(own_coalition_));
  const auto other = Lower(TacviewCoalition(own_coalition_ == Coalition::kBlue ? Coalition::kRed : Coalition::kBlue));

  if (!state.coalition.empty()) {
    const auto coalition = Lower(state.coalition);
    if (coalition == own) {
      return Side::kFriendly;
    }
    if (coalition == other) {
      return Side::kHostile;
    }
  }

  if (!state.color.empty()) {
    const auto color      = Lower(state.color);
    const auto own_color  = own_coalition_ == Coalition::kBlue ? "blue" : "red";
    const auto away_color = own_coalition_ == Coalition::kBlue ? "red" : "blue";
    if (color == own_color) {
      return Side::kFriendly;
    }
    if (color == away_color) {
      return Side::kHostile;
    }
  }

  return Side::kUnknown;
}

std::optional<TrackUpdate> AcmiDecoder::BuildUpdate(TrackId id, const ObjectState& state) const {
  if (!IsAircraft(state) || !state.longitude_offset || !state.latitude_offset || !state.altitude_m) {
    return std::nullopt;
  }

  TrackUpdate update;
  auto&       track = update.track;
  track.id          = id;
  track.side        = ClassifySide(state);
  track.pilot       = state.pilot;
  track.type_name   = state.name;

  track.position.latitude_deg     = reference_latitude_ + *state.latitude_offset;
  track.position.longitude_deg    = reference_longitude_ + *state.longitude_offset;
  track.position.altitude_m       = *state.altitude_m;
  track.position.heading_deg      = state.heading_deg.value_or(0.0);
  track.position.ground_speed_mps = state.ground_speed_mps.value_or(0.0);

  track.timestamp = reference_time_.value_or(util::TimePoint{}) +
                    std::chrono::duration_cast<util::Clock::duration>(std::chrono::duration<double>(frame_offset_s_));
  return update;
}

} // namespace awacs::telemetry
