#pragma once

#include "awacs/v1.hpp"
#include "service_context.hpp"

namespace awacs::service {

/*
  Operator queries over the live picture, sessions and counters.
  Transport independent; the gRPC adapter maps exceptions to status codes.
*/
class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  awacs::v1::GetPictureResponse   GetPicture(const awacs::v1::GetPictureRequest& req) const;
  awacs::v1::ListSessionsResponse ListSessions(const awacs::v1::ListSessionsRequest& req) const;
  awacs::v1::GetStatsResponse     GetStats(const awacs::v1::GetStatsRequest& req) const;

  // Runs the composer for a callsign without radio.
  // Throws util::RequesterNotFound, util::RequesterNotFriendly, util::UnrecognizedRequest.
  awacs::v1::ComposeCallResponse ComposeCall(const awacs::v1::ComposeCallRequest& req) const;

 private:
  ServiceContext ctx_;
};

} // namespace awacs::service
