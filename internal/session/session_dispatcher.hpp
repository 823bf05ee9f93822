#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/compose/reply_builder.hpp"
#include "internal/model/radio.hpp"
#include "internal/radio/radio_transport.hpp"
#include "internal/runtime/executor.hpp"
#include "internal/session/channel_arbiter.hpp"
#include "internal/session/radio_session.hpp"
#include "internal/speech/speech.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/time.hpp"

namespace awacs::session {

struct DispatcherOptions {
  SessionTimeouts                      timeouts;
  std::vector<awacs::model::Frequency> frequencies;
  std::string                          language{"en"};
};

struct SessionInfo {
  SessionId                     session_id{0};
  awacs::model::PilotId         pilot;
  awacs::model::Frequency       frequency{0};
  SessionState                  state{SessionState::kIdle};
  std::optional<util::Duration> deadline_in;
};

struct DispatcherStats {
  std::uint64_t sessions_created{0};
  std::uint64_t sessions_completed{0};
  std::uint64_t sessions_aborted{0};
  std::uint64_t replies_sent{0};
  std::uint64_t events_dropped{0};
  std::uint64_t active_sessions{0};
};

using SteadyClockFn = std::function<util::SteadyTime()>;

/*
  Routes radio events to per-pilot sessions and runs their effects.

  One session per pilot. Session transitions happen under one mutex;
  collaborator calls are started after it is released, and their
  completions come back through weak references, so a late completion
  for a removed session is dropped. Replies on a frequency are
  serialized through the ChannelArbiter.

  Must be owned by a std::shared_ptr (completions hold weak references).
*/
class SessionDispatcher : public std::enable_shared_from_this<SessionDispatcher> {
 public:
  SessionDispatcher(DispatcherOptions options, std::shared_ptr<speech::SpeechToText> stt, std::shared_ptr<speech::TextToSpeech> tts,
                    std::shared_ptr<radio::RadioSender> radio, std::shared_ptr<const compose::ReplyBuilder> replies,
                    std::shared_ptr<runtime::Executor> executor, SteadyClockFn clock = util::SteadyNow);

  // Radio transport handler. Safe from any thread.
  void OnRadioEvent(awacs::model::RadioEvent event);

  // Expires session deadlines.
  void Tick(util::SteadyTime now);

  // Aborts every session; later events are ignored.
  void Shutdown();

  std::vector<SessionInfo> ListSessions() const;
  DispatcherStats          stats() const;

  const ChannelArbiter& arbiter() const {
    return arbiter_;
  }

 private:
  struct Entry {
    std::unique_ptr<RadioSession>     session;
    util::CancellationTokenPtr        token;
    util::SteadyTime                  started_at{};
    std::optional<compose::ReplyKind> reply_kind;
  };

  using Actions = std::vector<std::function<void()>>;

  Entry& CreateSession(const awacs::model::PilotId& pilot, awacs::model::Frequency frequency, util::SteadyTime now);
  Entry* FindById(SessionId id);

  void Process(Entry& entry, Effects effects, util::SteadyTime now, Actions& actions);
  void DeliverGrant(awacs::model::Frequency frequency, std::optional<SessionId> granted, util::SteadyTime now, Actions& actions);
  void Reap(const awacs::model::PilotId& pilot, bool say_again, util::SteadyTime now, Actions& actions);
  void RecordOutcome(const Entry& entry, util::SteadyTime now);

  void StartTranscription(Entry& entry, BeginTranscription effect, Actions& actions);
  void StartComposition(Entry& entry, BeginComposition effect, Actions& actions);
  void StartSynthesis(Entry& entry, BeginSynthesis effect, Actions& actions);
  void StartTransmission(Entry& entry, BeginTransmission effect, Actions& actions);

  void OnTranscribed(SessionId id, OpId op, speech::TranscriptionResult result);
  void OnComposed(SessionId id, OpId op, std::optional<compose::Reply> reply);
  void OnCompositionFailed(SessionId id, OpId op);
  void OnSynthesized(SessionId id, OpId op, speech::SynthesisResult result);
  void OnTransmitted(SessionId id, OpId op, radio::TransmitResult result);

  // Runs `step` on the session under the lock, then starts queued work.
  void Complete(SessionId id, const std::function<Effects(Entry&, util::SteadyTime)>& step);

  static void Run(Actions& actions);

  DispatcherOptions                            options_;
  std::shared_ptr<speech::SpeechToText>        stt_;
  std::shared_ptr<speech::TextToSpeech>        tts_;
  std::shared_ptr<radio::RadioSender>          radio_;
  std::shared_ptr<const compose::ReplyBuilder> replies_;
  std::shared_ptr<runtime::Executor>           executor_;
  SteadyClockFn                                clock_;

  std::unordered_set<awacs::model::Frequency> monitored_;
  ChannelArbiter                              arbiter_;

  mutable std::mutex                                   mutex_;
  std::unordered_map<awacs::model::PilotId, Entry>     sessions_;
  std::unordered_map<SessionId, awacs::model::PilotId> pilots_by_id_;
  SessionId                                            next_id_{1};
  bool                                                 shutting_down_{false};
  DispatcherStats                                      stats_;
};

} // namespace awacs::session
