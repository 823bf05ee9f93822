#pragma once

#include <memory>
#include <vector>

#include "internal/config/settings.hpp"

#if AWACS_WITH_GRPC
#include <grpcpp/grpcpp.h>
#endif

namespace awacs::track {
class TrackStore;
}
namespace awacs::telemetry {
class TelemetryIngestor;
}
namespace awacs::radio {
class RadioTransport;
}
namespace awacs::runtime {
class WorkerPool;
class SessionTicker;
} // namespace awacs::runtime
namespace awacs::session {
class SessionDispatcher;
}
namespace awacs::service {
class AdminService;
}

namespace awacs::factory {

/*
  Application

  Owns every long-lived component of the controller. Start() brings the
  pipeline up in dependency order; Stop() takes it down in reverse.
*/
struct Application {
  std::shared_ptr<awacs::track::TrackStore>            store;
  std::shared_ptr<awacs::telemetry::TelemetryIngestor> ingestor;
  std::shared_ptr<awacs::runtime::WorkerPool>          workers;
  std::shared_ptr<awacs::runtime::WorkerPool>          speech_workers;
  std::shared_ptr<awacs::radio::RadioTransport>        radio;
  std::shared_ptr<awacs::session::SessionDispatcher>   dispatcher;
  std::shared_ptr<awacs::runtime::SessionTicker>       ticker;
  std::shared_ptr<awacs::service::AdminService>        admin_service;

#if AWACS_WITH_GRPC
  std::vector<std::shared_ptr<::grpc::Service>> grpc_services;
#endif

  void Start();
  void Stop();
};

/*
  Build

  Composition root: the only place that knows the concrete telemetry
  source, radio transport and speech collaborators.
  Throws util::InvalidConfig when a required collaborator cannot be built.
*/
Application Build(const awacs::config::Settings& settings);

} // namespace awacs::factory
