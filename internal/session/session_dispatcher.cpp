#include "internal/session/session_dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace awacs::session {

using awacs::observability::IntField;
using awacs::observability::StringField;
using awacs::observability::UintField;

namespace {

template <typename Event>
bool Is(const awacs::model::RadioEvent& event) {
  return std::holds_alternative<Event>(event);
}

} // namespace

SessionDispatcher::SessionDispatcher(DispatcherOptions options, std::shared_ptr<speech::SpeechToText> stt,
                                     std::shared_ptr<speech::TextToSpeech> tts, std::shared_ptr<radio::RadioSender> radio,
                                     std::shared_ptr<const compose::ReplyBuilder> replies, std::shared_ptr<runtime::Executor> executor,
                                     SteadyClockFn clock)
    : options_(std::move(options)),
      stt_(std::move(stt)),
      tts_(std::move(tts)),
      radio_(std::move(radio)),
      replies_(std::move(replies)),
      executor_(std::move(executor)),
      clock_(std::move(clock)),
      monitored_(options_.frequencies.begin(), options_.frequencies.end()) {
}

// ---------------- radio events ----------------

void SessionDispatcher::OnRadioEvent(awacs::model::RadioEvent event) {
  const auto pilot     = std::visit([](const auto& e) { return e.pilot; }, event);
  const auto frequency = std::visit([](const auto& e) { return e.frequency; }, event);
  const auto at        = std::visit([](const auto& e) { return e.at; }, event);

  Actions actions;
  {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
      return;
    }
    if (!monitored_.contains(frequency)) {
      ++stats_.events_dropped;
      AWACS_LOG_DEBUG("radio event on unmonitored frequency dropped", {StringField("pilot", pilot), UintField("frequency", frequency)});
      return;
    }

    const auto now = at == util::SteadyTime{} ? clock_() : at;

    // Human talkers hold the channel whether or not a session follows.
    std::optional<SessionId> freed;
    if (Is<awacs::model::TransmissionStarted>(event)) {
      arbiter_.KeyDown(frequency, pilot, now);
    } else if (Is<awacs::model::TransmissionEnded>(event) || Is<awacs::model::PilotDisconnected>(event)) {
      freed = arbiter_.KeyUp(frequency, pilot);
    }

    auto it = sessions_.find(pilot);
    if (it == sessions_.end() && Is<awacs::model::TransmissionStarted>(event)) {
      CreateSession(pilot, frequency, now);
      it = sessions_.find(pilot);
    }

    if (it == sessions_.end()) {
      if (!Is<awacs::model::PilotDisconnected>(event)) {
        ++stats_.events_dropped;
        AWACS_LOG_DEBUG("radio event without session dropped", {StringField("pilot", pilot), UintField("frequency", frequency)});
      }
    } else if (!it->second.session->Accepts(event)) {
      ++stats_.events_dropped;
      AWACS_LOG_DEBUG("radio event not accepted in current state",
                      {StringField("pilot", pilot), UintField("frequency", frequency),
                       StringField("state", ToString(it->second.session->state()))});
    } else {
      auto&   entry   = it->second;
      auto&   session = *entry.session;
      Effects effects;
      if (Is<awacs::model::TransmissionStarted>(event)) {
        entry.started_at = now;
        effects          = session.OnTransmissionStarted(now);
      } else if (auto* audio = std::get_if<awacs::model::AudioReceived>(&event)) {
        effects = session.OnAudio(std::move(audio->frame), now);
      } else if (Is<awacs::model::TransmissionEnded>(event)) {
        effects = session.OnTransmissionEnded(now);
      } else {
        effects = session.OnDisconnected(now);
      }
      Process(entry, std::move(effects), now, actions);
    }

    DeliverGrant(frequency, freed, now, actions);
  }
  Run(actions);
}

void SessionDispatcher::Tick(util::SteadyTime now) {
  Actions actions;
  {
    std::lock_guard lock(mutex_);

    std::vector<awacs::model::PilotId> expired;
    for (const auto& [pilot, entry] : sessions_) {
      const auto deadline = entry.session->deadline();
      if (deadline && now >= *deadline) {
        expired.push_back(pilot);
      }
    }

    for (const auto& pilot : expired) {
      auto it = sessions_.find(pilot);
      if (it == sessions_.end()) {
        continue;
      }
      Process(it->second, it->second.session->OnTick(now), now, actions);
    }

    // Key-ups lost on the wire would otherwise hold a frequency forever.
    auto stuck = arbiter_.ExpireTalkers(now - options_.timeouts.max_transmission);
    for (const auto& [frequency, pilot] : stuck.talkers) {
      AWACS_LOG_WARN("stuck talker released", {StringField("pilot", pilot), UintField("frequency", frequency)});
    }
    for (const auto& [frequency, granted] : stuck.grants) {
      DeliverGrant(frequency, granted, now, actions);
    }
  }
  Run(actions);
}

void SessionDispatcher::Shutdown() {
  Actions actions;
  {
    std::lock_guard lock(mutex_);
    if (shutting_down_) {
      return;
    }
    shutting_down_ = true;

    const auto                         now = clock_();
    std::vector<awacs::model::PilotId> pilots;
    pilots.reserve(sessions_.size());
    for (const auto& [pilot, entry] : sessions_) {
      pilots.push_back(pilot);
    }
    for (const auto& pilot : pilots) {
      auto it = sessions_.find(pilot);
      if (it == sessions_.end()) {
        continue;
      }
      Process(it->second, it->second.session->Abort(AbortReason::kShutdown), now, actions);
    }

    AWACS_LOG_INFO("session dispatcher stopped", {UintField("remaining", sessions_.size())});
  }
  Run(actions);
}

std::vector<SessionInfo> SessionDispatcher::ListSessions() const {
  std::lock_guard lock(mutex_);
  const auto      now = clock_();

  std::vector<SessionInfo> out;
  out.reserve(sessions_.size());
  for (const auto& [pilot, entry] : sessions_) {
    const auto& session = *entry.session;

    SessionInfo info;
    info.session_id = session.id();
    info.pilot      = pilot;
    info.frequency  = session.frequency();
    info.state      = session.state();
    if (const auto deadline = session.deadline()) {
      info.deadline_in = std::max(std::chrono::duration_cast<util::Duration>(*deadline - now), util::Duration::zero());
    }
    out.push_back(std::move(info));
  }

  std::sort(out.begin(), out.end(), [](const SessionInfo& a, const SessionInfo& b) { return a.session_id < b.session_id; });
  return out;
}

DispatcherStats SessionDispatcher::stats() const {
  std::lock_guard lock(mutex_);
  auto            out = stats_;
  out.active_sessions = sessions_.size();
  return out;
}

// ---------------- session bookkeeping ----------------

SessionDispatcher::Entry& SessionDispatcher::CreateSession(const awacs::model::PilotId& pilot, awacs::model::Frequency frequency,
                                                           util::SteadyTime now) {
  const auto id = next_id_++;

  Entry entry;
  entry.session    = std::make_unique<RadioSession>(id, pilot, frequency, options_.timeouts);
  entry.token      = util::MakeCancellationToken();
  entry.started_at = now;

  pilots_by_id_[id] = pilot;
  ++stats_.sessions_created;

  AWACS_LOG_DEBUG("session created", {UintField("session", id), StringField("pilot", pilot), UintField("frequency", frequency)});
  return sessions_.insert_or_assign(pilot, std::move(entry)).first->second;
}

SessionDispatcher::Entry* SessionDispatcher::FindById(SessionId id) {
  auto by_id = pilots_by_id_.find(id);
  if (by_id == pilots_by_id_.end()) {
    return nullptr;
  }
  auto it = sessions_.find(by_id->second);
  if (it == sessions_.end() || it->second.session->id() != id) {
    return nullptr;
  }
  return &it->second;
}

void SessionDispatcher::Process(Entry& entry, Effects effects, util::SteadyTime now, Actions& actions) {
  auto& session = *entry.session;

  bool                   say_again = false;
  std::vector<SessionId> granted;

  // Granting the channel to this session yields more effects; they are
  // appended and handled in the same pass.
  for (std::size_t i = 0; i < effects.size(); ++i) {
    Effect effect = std::move(effects[i]);

    if (auto* transcription = std::get_if<BeginTranscription>(&effect)) {
      StartTranscription(entry, std::move(*transcription), actions);
    } else if (auto* composition = std::get_if<BeginComposition>(&effect)) {
      StartComposition(entry, std::move(*composition), actions);
    } else if (auto* synthesis = std::get_if<BeginSynthesis>(&effect)) {
      StartSynthesis(entry, std::move(*synthesis), actions);
    } else if (auto* transmission = std::get_if<BeginTransmission>(&effect)) {
      StartTransmission(entry, std::move(*transmission), actions);
    } else if (std::holds_alternative<RequestChannel>(effect)) {
      if (arbiter_.Request(session.frequency(), session.id())) {
        for (auto& next : session.OnChannelGranted(now)) {
          effects.push_back(std::move(next));
        }
      } else {
        AWACS_LOG_DEBUG("waiting for channel", {UintField("session", session.id()), UintField("frequency", session.frequency())});
      }
    } else if (std::holds_alternative<ReleaseChannel>(effect)) {
      if (auto next = arbiter_.Release(session.frequency(), session.id())) {
        granted.push_back(*next);
      }
    } else if (std::holds_alternative<CancelPending>(effect)) {
      actions.emplace_back([token = entry.token] { token->Cancel(); });
    } else if (std::holds_alternative<QueueSayAgain>(effect)) {
      say_again = true;
    }
  }

  const auto pilot     = session.pilot();
  const auto frequency = session.frequency();
  Reap(pilot, say_again, now, actions);

  for (const auto id : granted) {
    DeliverGrant(frequency, id, now, actions);
  }
}

void SessionDispatcher::DeliverGrant(awacs::model::Frequency frequency, std::optional<SessionId> granted, util::SteadyTime now,
                                     Actions& actions) {
  while (granted) {
    auto* entry = shutting_down_ ? nullptr : FindById(*granted);
    if (entry && entry->session->state() == SessionState::kAwaitingChannel) {
      Process(*entry, entry->session->OnChannelGranted(now), now, actions);
      return;
    }
    // Granted to a session that has gone; pass the channel on.
    granted = arbiter_.Release(frequency, *granted);
  }
}

void SessionDispatcher::Reap(const awacs::model::PilotId& pilot, bool say_again, util::SteadyTime now, Actions& actions) {
  auto it = sessions_.find(pilot);
  if (it == sessions_.end()) {
    return;
  }

  const auto& session = *it->second.session;
  if (!session.finished() && session.state() != SessionState::kIdle) {
    return;
  }

  RecordOutcome(it->second, now);
  const auto frequency = session.frequency();
  pilots_by_id_.erase(session.id());
  sessions_.erase(it);

  if (!say_again || shutting_down_) {
    return;
  }

  auto reply = replies_->SayAgain(pilot);
  AWACS_LOG_INFO("queueing say again", {StringField("pilot", pilot), UintField("frequency", frequency)});

  auto& entry      = CreateSession(pilot, frequency, now);
  entry.reply_kind = reply.kind;
  Process(entry, entry.session->StartReply(std::move(reply.script), now), now, actions);
}

void SessionDispatcher::RecordOutcome(const Entry& entry, util::SteadyTime now) {
  const auto& session = *entry.session;
  auto&       metrics = observability::Metrics::Instance();

  if (session.state() == SessionState::kAborted) {
    ++stats_.sessions_aborted;
    metrics.RecordSessionOutcome(ToString(session.abort_reason()));
    AWACS_LOG_WARN("session aborted", {UintField("session", session.id()), StringField("pilot", session.pilot()),
                                       UintField("frequency", session.frequency()), StringField("reason", ToString(session.abort_reason()))});
    return;
  }
  if (!session.completed()) {
    return;
  }

  ++stats_.sessions_completed;
  if (!session.replied()) {
    metrics.RecordSessionOutcome("silent");
    AWACS_LOG_DEBUG("exchange ended without reply", {UintField("session", session.id()), StringField("pilot", session.pilot())});
    return;
  }

  ++stats_.replies_sent;
  const auto kind = entry.reply_kind ? compose::ToString(*entry.reply_kind) : std::string_view("unknown");
  metrics.RecordSessionOutcome("replied");

  std::int64_t exchange_ms = -1;
  if (const auto ended = session.transmission_ended_at()) {
    exchange_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - *ended).count();
    metrics.ObserveExchangeMs(kind, static_cast<double>(exchange_ms));
  }
  AWACS_LOG_INFO("reply transmitted", {UintField("session", session.id()), StringField("pilot", session.pilot()),
                                       UintField("frequency", session.frequency()), StringField("reply", kind),
                                       IntField("exchange_ms", exchange_ms)});
}

// ---------------- collaborator calls ----------------

void SessionDispatcher::StartTranscription(Entry& entry, BeginTranscription effect, Actions& actions) {
  const auto id = entry.session->id();
  actions.emplace_back([this, weak = weak_from_this(), id, token = entry.token, effect = std::move(effect)]() mutable {
    const auto op = effect.op;
    stt_->Transcribe(std::move(effect.audio), options_.language, options_.timeouts.transcription_timeout, token,
                     [weak, id, op](speech::TranscriptionResult result) {
                       if (auto self = weak.lock()) {
                         self->OnTranscribed(id, op, std::move(result));
                       }
                     });
  });
}

void SessionDispatcher::StartComposition(Entry& entry, BeginComposition effect, Actions& actions) {
  const auto id         = entry.session->id();
  const auto pilot      = entry.session->pilot();
  const auto started_at = entry.started_at;
  actions.emplace_back([this, weak = weak_from_this(), id, pilot, started_at, token = entry.token, effect = std::move(effect)]() mutable {
    executor_->Submit([weak, id, pilot, started_at, token, op = effect.op, transcript = std::move(effect.transcript)] {
      auto self = weak.lock();
      if (!self || token->cancelled()) {
        return;
      }

      observability::SpanScope span("awacs.session.compose", {UintField("session", id), StringField("pilot", pilot)});

      std::optional<compose::Reply> reply;
      try {
        reply = self->replies_->Build(pilot, transcript, started_at);
      } catch (const std::exception& e) {
        span.RecordException(e.what());
        AWACS_LOG_ERROR("composition failed", {UintField("session", id), StringField("pilot", pilot), StringField("error", e.what())});
        self->OnCompositionFailed(id, op);
        return;
      }
      self->OnComposed(id, op, std::move(reply));
    });
  });
}

void SessionDispatcher::StartSynthesis(Entry& entry, BeginSynthesis effect, Actions& actions) {
  const auto id = entry.session->id();
  actions.emplace_back([this, weak = weak_from_this(), id, token = entry.token, effect = std::move(effect)]() mutable {
    const auto op = effect.op;
    tts_->Synthesize(std::move(effect.script), options_.timeouts.synthesis_timeout, token, [weak, id, op](speech::SynthesisResult result) {
      if (auto self = weak.lock()) {
        self->OnSynthesized(id, op, std::move(result));
      }
    });
  });
}

void SessionDispatcher::StartTransmission(Entry& entry, BeginTransmission effect, Actions& actions) {
  const auto id        = entry.session->id();
  const auto frequency = entry.session->frequency();
  actions.emplace_back([this, weak = weak_from_this(), id, frequency, token = entry.token, effect = std::move(effect)]() mutable {
    const auto op = effect.op;
    radio_->Transmit(frequency, std::move(effect.audio), token, [weak, id, op](radio::TransmitResult result) {
      if (auto self = weak.lock()) {
        self->OnTransmitted(id, op, std::move(result));
      }
    });
  });
}

// ---------------- completions ----------------

void SessionDispatcher::OnTranscribed(SessionId id, OpId op, speech::TranscriptionResult result) {
  if (!result.ok) {
    AWACS_LOG_WARN("transcription failed", {UintField("session", id), StringField("error", result.error)});
  }
  Complete(id, [&](Entry& entry, util::SteadyTime now) { return entry.session->OnTranscription(op, std::move(result), now); });
}

void SessionDispatcher::OnComposed(SessionId id, OpId op, std::optional<compose::Reply> reply) {
  Complete(id, [&](Entry& entry, util::SteadyTime now) {
    if (!reply) {
      return entry.session->OnComposed(op, std::nullopt, now);
    }
    if (entry.session->Matches(op)) {
      entry.reply_kind = reply->kind;
    }
    return entry.session->OnComposed(op, std::move(reply->script), now);
  });
}

void SessionDispatcher::OnCompositionFailed(SessionId id, OpId op) {
  Complete(id, [&](Entry& entry, util::SteadyTime now) { return entry.session->OnCompositionFailed(op, now); });
}

void SessionDispatcher::OnSynthesized(SessionId id, OpId op, speech::SynthesisResult result) {
  if (!result.ok) {
    AWACS_LOG_WARN("synthesis failed", {UintField("session", id), StringField("error", result.error)});
  }
  Complete(id, [&](Entry& entry, util::SteadyTime now) { return entry.session->OnSynthesis(op, std::move(result), now); });
}

void SessionDispatcher::OnTransmitted(SessionId id, OpId op, radio::TransmitResult result) {
  if (!result.ok) {
    AWACS_LOG_WARN("transmission failed", {UintField("session", id), StringField("error", result.error)});
  }
  Complete(id, [&](Entry& entry, util::SteadyTime now) { return entry.session->OnTransmitted(op, std::move(result), now); });
}

void SessionDispatcher::Complete(SessionId id, const std::function<Effects(Entry&, util::SteadyTime)>& step) {
  Actions actions;
  {
    std::lock_guard lock(mutex_);
    auto*           entry = FindById(id);
    if (!entry) {
      AWACS_LOG_DEBUG("late completion dropped", {UintField("session", id)});
      return;
    }
    const auto now = clock_();
    Process(*entry, step(*entry, now), now, actions);
  }
  Run(actions);
}

void SessionDispatcher::Run(Actions& actions) {
  for (auto& action : actions) {
    try {
      action();
    } catch (const std::exception& e) {
      // The session's deadline expires the exchange.
      AWACS_LOG_ERROR("session action failed", {StringField("error", e.what())});
    }
  }
}

} // namespace awacs::session
