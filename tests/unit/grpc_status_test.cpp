#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/compose/call_composer.hpp"
#include "internal/compose/phraseology.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/track/track_store.hpp"
#include "internal/util/errors.hpp"

namespace {

std::shared_ptr<awacs::track::TrackStore> BuildStore() {
  auto store  = std::make_shared<awacs::track::TrackStore>();
  auto writer = store->OpenWriter();

  awacs::model::AircraftTrack bandit;
  bandit.id        = 2;
  bandit.side      = awacs::model::Side::kHostile;
  bandit.pilot     = "Ivan 1";
  bandit.timestamp = awacs::util::Now();
  bandit.last_seen = awacs::util::SteadyNow();
  writer->Upsert(bandit);
  return store;
}

awacs::grpc::AdminServer BuildServer() {
  auto                           store = BuildStore();
  awacs::service::ServiceContext ctx;
  ctx.store       = store;
  ctx.composer    = std::make_shared<awacs::compose::CallComposer>(store, 100.0);
  ctx.phraseology = std::make_shared<awacs::compose::Phraseology>("Overlord");
  return awacs::grpc::AdminServer(std::make_shared<awacs::service::AdminService>(ctx));
}

::grpc::StatusCode ComposeStatus(awacs::grpc::AdminServer& server, const std::string& callsign, awacs::v1::CallKind kind) {
  awacs::v1::ComposeCallRequest req;
  req.set_callsign(callsign);
  req.set_kind(kind);
  awacs::v1::ComposeCallResponse resp;
  ::grpc::ServerContext          grpc_ctx;
  return server.ComposeCall(&grpc_ctx, &req, &resp).error_code();
}

void TestComposeCallStatuses() {
  auto server = BuildServer();
  assert(ComposeStatus(server, "Ghost 9", awacs::v1::CALL_KIND_BOGEY_DOPE) == ::grpc::StatusCode::NOT_FOUND);
  assert(ComposeStatus(server, "Ivan 1", awacs::v1::CALL_KIND_BOGEY_DOPE) == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ComposeStatus(server, "", awacs::v1::CALL_KIND_BOGEY_DOPE) == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ComposeStatus(server, "Ivan 1", awacs::v1::CALL_KIND_UNSPECIFIED) == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ComposeStatus(server, "Ivan 1", awacs::v1::CALL_KIND_RADIO_CHECK) == ::grpc::StatusCode::OK);
}

void TestPictureIsOk() {
  auto                           server = BuildServer();
  awacs::v1::GetPictureRequest   req;
  awacs::v1::GetPictureResponse  resp;
  ::grpc::ServerContext          grpc_ctx;
  assert(server.GetPicture(&grpc_ctx, &req, &resp).ok());
  assert(resp.tracks_size() == 1);
}

void TestExceptionMapping() {
  using awacs::grpc::ToStatus;
  assert(ToStatus(awacs::util::TransportDisconnected("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(awacs::util::CollaboratorFailure("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(awacs::util::ChannelBusy("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(awacs::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestComposeCallStatuses();
  TestPictureIsOk();
  TestExceptionMapping();

  std::cout << "awacs_unit_grpc_status: pass\n";
  return 0;
}
