#pragma once

#include <memory>

namespace awacs::track {
class TrackStore;
}
namespace awacs::telemetry {
class TelemetryIngestor;
}
namespace awacs::session {
class SessionDispatcher;
}
namespace awacs::compose {
class CallComposer;
class Phraseology;
} // namespace awacs::compose

namespace awacs::service {

/*
  Dependency container shared by the admin surface.
*/
struct ServiceContext {
  std::shared_ptr<const awacs::track::TrackStore>            store;
  std::shared_ptr<const awacs::telemetry::TelemetryIngestor> ingestor;
  std::shared_ptr<const awacs::session::SessionDispatcher>   dispatcher;
  std::shared_ptr<const awacs::compose::CallComposer>        composer;
  std::shared_ptr<const awacs::compose::Phraseology>         phraseology;
};

} // namespace awacs::service
