#include <grpcpp/grpcpp.h>

#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "awacs/v1.hpp"

using namespace awacs::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  awacsctl <addr> picture [friendly|hostile|unknown]\n"
            << "  awacsctl <addr> sessions\n"
            << "  awacsctl <addr> stats\n"
            << "  awacsctl <addr> call <callsign> [bogey-dope|radio-check]\n";
}

static std::optional<Side> ParseSide(const std::string& value) {
  if (value == "friendly") {
    return SIDE_FRIENDLY;
  }
  if (value == "hostile") {
    return SIDE_HOSTILE;
  }
  if (value == "unknown") {
    return SIDE_UNKNOWN;
  }
  return std::nullopt;
}

static std::optional<CallKind> ParseCallKind(const std::string& value) {
  if (value == "bogey-dope") {
    return CALL_KIND_BOGEY_DOPE;
  }
  if (value == "radio-check") {
    return CALL_KIND_RADIO_CHECK;
  }
  return std::nullopt;
}

static const char* SideName(Side side) {
  switch (side) {
    case SIDE_FRIENDLY:
      return "friendly";
    case SIDE_HOSTILE:
      return "hostile";
    default:
      return "unknown";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = ControllerAdmin::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "picture") {
    GetPictureRequest req;
    if (argc >= 4) {
      auto side = ParseSide(argv[3]);
      if (!side) {
        std::cerr << "unsupported side: " << argv[3] << "\n";
        return 1;
      }
      req.set_side(*side);
    }

    GetPictureResponse resp;
    auto               status = stub->GetPicture(&ctx, req, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << std::fixed << std::setprecision(4);
    for (const auto& track : resp.tracks()) {
      std::cout << std::hex << track.id() << std::dec << "  " << SideName(track.side()) << "  " << track.type_name() << "  "
                << (track.pilot().empty() ? "-" : track.pilot()) << "  " << track.latitude() << "," << track.longitude() << "  "
                << static_cast<long>(track.altitude_m() * 3.28084) << "ft  hdg " << static_cast<int>(track.heading_deg()) << "  age "
                << track.age_ms() << "ms\n";
    }
    std::cout << resp.tracks_size() << " track(s)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sessions") {
    ListSessionsResponse resp;
    auto                 status = stub->ListSessions(&ctx, ListSessionsRequest{}, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    for (const auto& session : resp.sessions()) {
      std::cout << session.session_id() << "  " << session.pilot() << "  " << session.frequency() << "Hz  " << session.state();
      if (session.deadline_in_ms() > 0) {
        std::cout << "  deadline in " << session.deadline_in_ms() << "ms";
      }
      std::cout << "\n";
    }
    std::cout << resp.sessions_size() << " session(s)\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    GetStatsResponse resp;
    auto             status = stub->GetStats(&ctx, GetStatsRequest{}, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    const auto& telemetry = resp.telemetry();
    const auto& sessions  = resp.sessions();
    std::cout << "live_tracks=" << resp.live_tracks() << "\n"
              << "telemetry connected=" << (telemetry.connected() ? "true" : "false") << " applied=" << telemetry.records_applied()
              << " stale=" << telemetry.records_stale() << " malformed=" << telemetry.records_malformed()
              << " evicted=" << telemetry.tracks_evicted() << " reconnects=" << telemetry.reconnects() << "\n"
              << "sessions active=" << sessions.active() << " created=" << sessions.created() << " completed=" << sessions.completed()
              << " replies=" << sessions.replies() << " aborted=" << sessions.aborted() << " dropped_events=" << sessions.dropped_events()
              << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "call") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    ComposeCallRequest req;
    req.set_callsign(argv[3]);
    req.set_kind(CALL_KIND_BOGEY_DOPE);
    if (argc >= 5) {
      auto kind = ParseCallKind(argv[4]);
      if (!kind) {
        std::cerr << "unsupported call: " << argv[4] << "\n";
        return 1;
      }
      req.set_kind(*kind);
    }

    ComposeCallResponse resp;
    auto                status = stub->ComposeCall(&ctx, req, &resp);
    if (!status.ok()) {
      return Fail(status);
    }

    std::cout << resp.kind() << ": " << resp.script() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
