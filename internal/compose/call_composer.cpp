#include "internal/compose/call_composer.hpp"

#include <limits>
#include <variant>

#include "internal/geometry/geometry.hpp"
#include "internal/util/errors.hpp"

namespace awacs::compose {

using awacs::model::AircraftTrack;
using awacs::model::CallOutcome;
using awacs::model::Side;

CallComposer::CallComposer(std::shared_ptr<const track::TrackStore> store, double search_radius_nm)
    : store_(std::move(store)), search_radius_nm_(search_radius_nm) {
}

CallOutcome CallComposer::Compose(const awacs::model::RadioRequest& request) const {
  auto snapshot = store_->Snapshot();
  return Compose(request, *snapshot);
}

CallOutcome CallComposer::Compose(const awacs::model::RadioRequest& request, const track::TrackSnapshot& snapshot) const {
  struct Visitor {
    const CallComposer&               composer;
    const awacs::model::RadioRequest& request;
    const track::TrackSnapshot&       snapshot;

    CallOutcome operator()(const awacs::model::BogeyDopeRequest&) const {
      const auto& requester = composer.LocateRequester(request.pilot, snapshot);
      return composer.BogeyDope(requester, snapshot);
    }

    CallOutcome operator()(const awacs::model::RadioCheckRequest&) const {
      return awacs::model::RadioCheckCall{};
    }
  };
  return std::visit(Visitor{*this, request, snapshot}, request.kind);
}

const AircraftTrack& CallComposer::LocateRequester(const std::string& pilot, const track::TrackSnapshot& snapshot) const {
  const auto* requester = snapshot.FindByPilot(pilot);
  if (requester == nullptr) {
    throw util::RequesterNotFound("no track for '" + pilot + "'");
  }
  if (requester->side != Side::kFriendly) {
    throw util::RequesterNotFriendly("'" + pilot + "' is " + std::string(awacs::model::ToString(requester->side)));
  }
  return *requester;
}

CallOutcome CallComposer::BogeyDope(const AircraftTrack& requester, const track::TrackSnapshot& snapshot) const {
  const auto observer = snapshot.PositionOf(requester);

  const AircraftTrack*   nearest = nullptr;
  awacs::model::Position nearest_position;
  double                 nearest_range_nm = std::numeric_limits<double>::infinity();

  // Snapshot is sorted by id, so strict < keeps the lower id on ties.
  for (const auto& candidate : snapshot.tracks()) {
    if (candidate.id == requester.id || candidate.side == Side::kFriendly) {
      continue;
    }
    const auto position = snapshot.PositionOf(candidate);
    const auto range_nm = geometry::RangeNm(observer, position);
    if (range_nm > search_radius_nm_ || range_nm >= nearest_range_nm) {
      continue;
    }
    nearest          = &candidate;
    nearest_position = position;
    nearest_range_nm = range_nm;
  }

  if (nearest == nullptr) {
    return awacs::model::CleanCall{};
  }

  auto result        = geometry::ToCallResult(observer, nearest_position);
  result.target_id   = nearest->id;
  result.target_side = nearest->side;
  result.target_type = nearest->type_name;
  return awacs::model::BogeyDopeCall{std::move(result)};
}

} // namespace awacs::compose
