#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace awacs::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace awacs::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const RequesterNotFriendly*>(&e) || dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const UnrecognizedRequest*>(&e) || dynamic_cast<const InvalidConfig*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const TransportDisconnected*>(&e) || dynamic_cast<const CollaboratorFailure*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const ChannelBusy*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace awacs::grpc
