#pragma once

#include <memory>
#include <string>

#include "internal/model/call_result.hpp"
#include "internal/model/request.hpp"
#include "internal/track/track_store.hpp"

namespace awacs::compose {

/*
  Answers radio requests from a track snapshot.

  Pure query: takes one snapshot per request and never writes, so any
  number of sessions may compose concurrently.

  Errors:
    util::RequesterNotFound    - no track for the requester's callsign
    util::RequesterNotFriendly - requester is not on the controller's side
*/
class CallComposer {
 public:
  CallComposer(std::shared_ptr<const track::TrackStore> store, double search_radius_nm);

  awacs::model::CallOutcome Compose(const awacs::model::RadioRequest& request) const;
  awacs::model::CallOutcome Compose(const awacs::model::RadioRequest& request, const track::TrackSnapshot& snapshot) const;

  // Nearest hostile/unknown contact within the search radius, ties to the lower id.
  awacs::model::CallOutcome BogeyDope(const awacs::model::AircraftTrack& requester, const track::TrackSnapshot& snapshot) const;

  double search_radius_nm() const {
    return search_radius_nm_;
  }

 private:
  const awacs::model::AircraftTrack& LocateRequester(const std::string& pilot, const track::TrackSnapshot& snapshot) const;

  std::shared_ptr<const track::TrackStore> store_;
  double                                   search_radius_nm_;
};

} // namespace awacs::compose
