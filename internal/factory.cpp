#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/compose/call_composer.hpp"
#include "internal/compose/phraseology.hpp"
#include "internal/compose/reply_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/radio/udp_radio_transport.hpp"
#include "internal/recognition/intent_classifier.hpp"
#include "internal/runtime/session_ticker.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/session/session_dispatcher.hpp"
#include "internal/telemetry/tcp_telemetry_source.hpp"
#include "internal/telemetry/telemetry_ingestor.hpp"
#include "internal/track/track_store.hpp"
#include "internal/util/errors.hpp"
#if AWACS_WITH_GRPC
#include "internal/grpc/admin_server.hpp"
#include "internal/speech/grpc_speech_gateway.hpp"
#endif

namespace awacs::factory {

using awacs::observability::StringField;
using awacs::observability::UintField;

namespace {

struct SpeechCollaborators {
  std::shared_ptr<speech::SpeechToText> stt;
  std::shared_ptr<speech::TextToSpeech> tts;
};

SpeechCollaborators BuildSpeech(const config::SpeechSettings& settings, const std::shared_ptr<runtime::Executor>& executor) {
#if AWACS_WITH_GRPC
  if (settings.gateway_address.empty()) {
    throw util::InvalidConfig("speech.gateway_address is required");
  }

  speech::SpeechGatewayOptions options;
  options.api_key = settings.api_key;
  options.voice   = settings.voice;
  options.speed   = settings.speed;

  auto channel = ::grpc::CreateChannel(settings.gateway_address, ::grpc::InsecureChannelCredentials());
  auto gateway = std::make_shared<speech::GrpcSpeechGateway>(std::move(channel), executor, std::move(options));
  AWACS_LOG_INFO("speech gateway configured", {StringField("address", settings.gateway_address)});
  return {gateway, gateway};
#else
  (void)settings;
  (void)executor;
  throw util::InvalidConfig("speech gateway requires a build with gRPC support");
#endif
}

telemetry::IngestorOptions ToIngestorOptions(const config::TelemetrySettings& settings) {
  telemetry::IngestorOptions options;
  options.staleness_window          = settings.staleness_window;
  options.eviction_interval         = settings.eviction_interval;
  options.reconnect_initial_backoff = settings.reconnect_initial_backoff;
  options.reconnect_max_backoff     = settings.reconnect_max_backoff;
  return options;
}

session::SessionTimeouts ToTimeouts(const config::SessionSettings& settings) {
  session::SessionTimeouts timeouts;
  timeouts.max_transmission       = settings.max_transmission;
  timeouts.transcription_timeout  = settings.transcription_timeout;
  timeouts.composition_timeout    = settings.composition_timeout;
  timeouts.synthesis_timeout      = settings.synthesis_timeout;
  timeouts.channel_wait_timeout   = settings.channel_wait_timeout;
  timeouts.transmit_timeout       = settings.transmit_timeout;
  timeouts.transcription_attempts = settings.transcription_attempts;
  return timeouts;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const config::Settings& settings) {
  Application app;

  // ------------------------------------------------------------------
  // Track picture
  // ------------------------------------------------------------------
  app.store = std::make_shared<track::TrackStore>(settings.telemetry.staleness_window, settings.telemetry.max_extrapolation);

  telemetry::TcpTelemetryOptions source_options;
  source_options.host          = settings.telemetry.host;
  source_options.port          = settings.telemetry.port;
  source_options.username      = settings.telemetry.username;
  source_options.password_hash = settings.telemetry.password_hash;

  app.ingestor = std::make_shared<telemetry::TelemetryIngestor>(app.store, std::make_unique<telemetry::TcpTelemetrySource>(source_options),
                                                                settings.controller.coalition, ToIngestorOptions(settings.telemetry));

  // ------------------------------------------------------------------
  // Call composition
  // ------------------------------------------------------------------
  auto classifier  = std::make_shared<recognition::IntentClassifier>(settings.controller.callsign);
  auto composer    = std::make_shared<compose::CallComposer>(app.store, settings.calls.search_radius_nm);
  auto phraseology = std::make_shared<compose::Phraseology>(settings.controller.callsign);
  auto replies     = std::make_shared<compose::ReplyBuilder>(classifier, composer, phraseology);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  app.workers        = std::make_shared<runtime::WorkerPool>(settings.worker_threads);
  app.speech_workers = std::make_shared<runtime::WorkerPool>(settings.speech.max_concurrent_calls);
  auto speech        = BuildSpeech(settings.speech, app.speech_workers);

  radio::UdpRadioOptions radio_options;
  radio_options.bind_address          = settings.radio.bind_address;
  radio_options.bind_port             = settings.radio.bind_port;
  radio_options.server_address        = settings.radio.server_address;
  radio_options.server_port           = settings.radio.server_port;
  radio_options.unit_name             = settings.radio.unit_name;
  radio_options.frequencies           = settings.radio.frequencies;
  radio_options.reconnect_max_backoff = settings.radio.reconnect_max_backoff;
  app.radio                           = std::make_shared<radio::UdpRadioTransport>(radio_options);

  // ------------------------------------------------------------------
  // Sessions
  // ------------------------------------------------------------------
  session::DispatcherOptions dispatcher_options;
  dispatcher_options.timeouts    = ToTimeouts(settings.sessions);
  dispatcher_options.frequencies = settings.radio.frequencies;
  dispatcher_options.language    = settings.sessions.language;

  app.dispatcher = std::make_shared<session::SessionDispatcher>(std::move(dispatcher_options), speech.stt, speech.tts, app.radio, replies,
                                                                app.workers);
  app.ticker     = std::make_shared<runtime::SessionTicker>(app.dispatcher, settings.sessions.tick_interval);

  // ------------------------------------------------------------------
  // Admin surface
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store       = app.store;
  ctx.ingestor    = app.ingestor;
  ctx.dispatcher  = app.dispatcher;
  ctx.composer    = composer;
  ctx.phraseology = phraseology;

  app.admin_service = std::make_shared<service::AdminService>(ctx);
#if AWACS_WITH_GRPC
  app.grpc_services.push_back(std::make_shared<grpc::AdminServer>(app.admin_service));
#endif

  return app;
}

void Application::Start() {
  workers->Start();
  speech_workers->Start();
  ingestor->Start();

  std::weak_ptr<session::SessionDispatcher> weak = dispatcher;
  radio->Start([weak](awacs::model::RadioEvent event) {
    if (auto target = weak.lock()) {
      target->OnRadioEvent(std::move(event));
    }
  });
  ticker->Start();

  AWACS_LOG_INFO("controller pipeline started", {UintField("live_tracks", store->size())});
}

void Application::Stop() {
  if (radio) {
    radio->Stop();
  }
  if (ticker) {
    ticker->Stop();
  }
  if (ingestor) {
    ingestor->Stop();
  }
  if (dispatcher) {
    dispatcher->Shutdown();
  }
  if (speech_workers) {
    speech_workers->Stop();
  }
  if (workers) {
    workers->Stop();
  }
}

} // namespace awacs::factory
