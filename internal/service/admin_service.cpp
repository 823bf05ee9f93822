#include "admin_service.hpp"

#include <chrono>

#include "internal/compose/call_composer.hpp"
#include "internal/compose/phraseology.hpp"
#include "internal/compose/reply_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/session/session_dispatcher.hpp"
#include "internal/telemetry/telemetry_ingestor.hpp"
#include "internal/track/track_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace awacs::service {

using namespace awacs::v1;

namespace {

Side ToProto(awacs::model::Side side) {
  switch (side) {
    case awacs::model::Side::kFriendly:
      return SIDE_FRIENDLY;
    case awacs::model::Side::kHostile:
      return SIDE_HOSTILE;
    case awacs::model::Side::kUnknown:
      return SIDE_UNKNOWN;
  }
  return SIDE_UNKNOWN;
}

template <typename Fn>
auto Traced(std::string_view route, Fn&& fn) -> decltype(fn()) {
  awacs::observability::SpanScope span(route);
  try {
    return fn();
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    AWACS_LOG_WARN("RPC failed", {awacs::observability::StringField("route", route), awacs::observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetPictureResponse AdminService::GetPicture(const GetPictureRequest& req) const {
  return Traced("AdminService.GetPicture", [&] {
    GetPictureResponse resp;
    const auto         now      = util::SteadyNow();
    const auto         snapshot = ctx_.store->Snapshot(now);

    for (const auto& track : snapshot->tracks()) {
      const auto side = ToProto(track.side);
      if (req.side() != SIDE_UNSPECIFIED && req.side() != side) {
        continue;
      }

      const auto position = snapshot->PositionOf(track);
      auto*      out      = resp.add_tracks();
      out->set_id(track.id);
      out->set_side(side);
      out->set_pilot(track.pilot);
      out->set_type_name(track.type_name);
      out->set_latitude(position.latitude_deg);
      out->set_longitude(position.longitude_deg);
      out->set_altitude_m(position.altitude_m);
      out->set_heading_deg(position.heading_deg);
      out->set_ground_speed_mps(position.ground_speed_mps);
      *out->mutable_timestamp() = util::ToProto(track.timestamp);
      out->set_age_ms(static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now - track.last_seen).count()));
    }
    return resp;
  });
}

ListSessionsResponse AdminService::ListSessions(const ListSessionsRequest&) const {
  return Traced("AdminService.ListSessions", [&] {
    ListSessionsResponse resp;
    if (!ctx_.dispatcher) {
      return resp;
    }
    for (const auto& info : ctx_.dispatcher->ListSessions()) {
      auto* out = resp.add_sessions();
      out->set_session_id(info.session_id);
      out->set_pilot(info.pilot);
      out->set_frequency(info.frequency);
      out->set_state(std::string(session::ToString(info.state)));
      out->set_deadline_in_ms(info.deadline_in ? static_cast<std::uint64_t>(info.deadline_in->count()) : 0);
    }
    return resp;
  });
}

GetStatsResponse AdminService::GetStats(const GetStatsRequest&) const {
  return Traced("AdminService.GetStats", [&] {
    GetStatsResponse resp;

    if (ctx_.ingestor) {
      const auto ingest    = ctx_.ingestor->stats();
      auto*      telemetry = resp.mutable_telemetry();
      telemetry->set_records_applied(ingest.records_applied);
      telemetry->set_records_stale(ingest.records_stale);
      telemetry->set_records_malformed(ingest.records_malformed);
      telemetry->set_reconnects(ingest.reconnects);
      telemetry->set_tracks_evicted(ingest.tracks_evicted);
      telemetry->set_connected(ingest.connected);
    }

    if (ctx_.dispatcher) {
      const auto dispatch = ctx_.dispatcher->stats();
      auto*      sessions = resp.mutable_sessions();
      sessions->set_created(dispatch.sessions_created);
      sessions->set_completed(dispatch.sessions_completed);
      sessions->set_aborted(dispatch.sessions_aborted);
      sessions->set_dropped_events(dispatch.events_dropped);
      sessions->set_active(dispatch.active_sessions);
      sessions->set_replies(dispatch.replies_sent);
    }

    resp.set_live_tracks(ctx_.store->Snapshot()->size());
    return resp;
  });
}

ComposeCallResponse AdminService::ComposeCall(const ComposeCallRequest& req) const {
  return Traced("AdminService.ComposeCall", [&] {
    if (req.callsign().empty()) {
      throw util::UnrecognizedRequest("callsign is required");
    }

    awacs::model::RadioRequest request;
    request.pilot              = req.callsign();
    request.transmission_start = util::SteadyNow();
    switch (req.kind()) {
      case CALL_KIND_BOGEY_DOPE:
        request.kind = awacs::model::BogeyDopeRequest{};
        break;
      case CALL_KIND_RADIO_CHECK:
        request.kind = awacs::model::RadioCheckRequest{};
        break;
      default:
        throw util::UnrecognizedRequest("call kind is required");
    }

    const auto outcome = ctx_.composer->Compose(request);

    ComposeCallResponse resp;
    resp.set_script(ctx_.phraseology->Render(request.pilot, outcome));
    resp.set_kind(std::string(compose::ToString(compose::KindOf(outcome))));
    return resp;
  });
}

} // namespace awacs::service
