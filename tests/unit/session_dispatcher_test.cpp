#include "internal/session/session_dispatcher.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

#include "internal/runtime/worker_pool.hpp"

namespace {

using awacs::model::AudioFrame;
using awacs::model::AudioReceived;
using awacs::model::PilotDisconnected;
using awacs::model::TransmissionEnded;
using awacs::model::TransmissionStarted;
using awacs::session::DispatcherOptions;
using awacs::session::SessionDispatcher;
using awacs::session::SessionState;
using awacs::util::SteadyTime;
using namespace std::chrono_literals;

constexpr awacs::model::Frequency kFreq  = 251000000;
constexpr awacs::model::Frequency kOther = 264000000;

// Collaborator fakes park each call until the test completes it.

class FakeStt : public awacs::speech::SpeechToText {
 public:
  struct Call {
    awacs::model::AudioBuffer            audio;
    awacs::util::CancellationTokenPtr    token;
    awacs::speech::TranscriptionCallback done;
  };

  void Transcribe(awacs::model::AudioBuffer audio, std::string, awacs::util::Duration, awacs::util::CancellationTokenPtr token,
                  awacs::speech::TranscriptionCallback done) override {
    calls.push_back({std::move(audio), std::move(token), std::move(done)});
  }

  void Finish(std::size_t index, std::string text) {
    calls.at(index).done(awacs::speech::TranscriptionResult::Success(std::move(text)));
  }

  std::vector<Call> calls;
};

class FakeTts : public awacs::speech::TextToSpeech {
 public:
  struct Call {
    std::string                      script;
    awacs::speech::SynthesisCallback done;
  };

  void Synthesize(std::string script, awacs::util::Duration, awacs::util::CancellationTokenPtr,
                  awacs::speech::SynthesisCallback done) override {
    calls.push_back({std::move(script), std::move(done)});
  }

  void Finish(std::size_t index) {
    calls.at(index).done(awacs::speech::SynthesisResult::Success({AudioFrame(16, 1), AudioFrame(16, 2)}));
  }

  std::vector<Call> calls;
};

class FakeRadio : public awacs::radio::RadioSender {
 public:
  struct Call {
    awacs::model::Frequency        frequency{0};
    awacs::radio::TransmitCallback done;
  };

  void Transmit(awacs::model::Frequency frequency, awacs::model::AudioBuffer, awacs::util::CancellationTokenPtr,
                awacs::radio::TransmitCallback done) override {
    ++in_flight;
    max_in_flight = std::max(max_in_flight, in_flight);
    calls.push_back({frequency, std::move(done)});
  }

  void Finish(std::size_t index, bool ok = true) {
    --in_flight;
    calls.at(index).done({ok, ok ? "" : "socket closed"});
  }

  std::vector<Call> calls;
  int               in_flight{0};
  int               max_in_flight{0};
};

class InlineExecutor : public awacs::runtime::Executor {
 public:
  void Submit(std::function<void()> task) override {
    task();
  }
};

struct Harness {
  SteadyTime now = SteadyTime{} + 1h;

  std::shared_ptr<FakeStt>   stt   = std::make_shared<FakeStt>();
  std::shared_ptr<FakeTts>   tts   = std::make_shared<FakeTts>();
  std::shared_ptr<FakeRadio> radio = std::make_shared<FakeRadio>();

  std::shared_ptr<awacs::track::TrackStore> store = std::make_shared<awacs::track::TrackStore>();

  std::shared_ptr<SessionDispatcher> dispatcher;

  Harness() {
    auto replies = std::make_shared<awacs::compose::ReplyBuilder>(std::make_shared<awacs::recognition::IntentClassifier>("Overlord"),
                                                                  std::make_shared<awacs::compose::CallComposer>(store, 100.0),
                                                                  std::make_shared<awacs::compose::Phraseology>("Overlord"));
    DispatcherOptions options;
    options.frequencies = {kFreq, kOther};
    dispatcher = std::make_shared<SessionDispatcher>(options, stt, tts, radio, replies, std::make_shared<InlineExecutor>(),
                                                     [this] { return now; });
  }

  // Key-down, one audio frame, key-up.
  void Speak(const std::string& pilot, awacs::model::Frequency frequency = kFreq) {
    dispatcher->OnRadioEvent(TransmissionStarted{pilot, frequency, now});
    dispatcher->OnRadioEvent(AudioReceived{pilot, frequency, AudioFrame(32, 7), now + 100ms});
    dispatcher->OnRadioEvent(TransmissionEnded{pilot, frequency, now + 1s});
  }

  SessionState StateOf(const std::string& pilot) const {
    for (const auto& info : dispatcher->ListSessions()) {
      if (info.pilot == pilot) {
        return info.state;
      }
    }
    return SessionState::kIdle;
  }
};

void TestRadioCheckExchange() {
  Harness h;
  h.Speak("Enfield 1-1");
  assert(h.stt->calls.size() == 1);
  assert(h.stt->calls[0].audio.size() == 1);
  assert(h.StateOf("Enfield 1-1") == SessionState::kTranscribing);

  h.now += 2s;
  h.stt->Finish(0, "Overlord, Enfield 1-1, radio check");
  assert(h.tts->calls.size() == 1);
  assert(h.tts->calls[0].script == "Enfield 1-1, Overlord, five by five");

  h.tts->Finish(0);
  assert(h.radio->calls.size() == 1);
  assert(h.radio->calls[0].frequency == kFreq);
  assert(h.dispatcher->arbiter().Holder(kFreq).has_value());

  h.radio->Finish(0);
  const auto stats = h.dispatcher->stats();
  assert(stats.sessions_created == 1);
  assert(stats.sessions_completed == 1);
  assert(stats.replies_sent == 1);
  assert(stats.active_sessions == 0);
  assert(!h.dispatcher->arbiter().Busy(kFreq));
}

void TestOneTransmitterPerFrequency() {
  Harness h;
  h.Speak("Enfield 1-1");
  h.Speak("Enfield 1-2");
  h.Speak("Springfield 1-1", kOther);
  h.stt->Finish(0, "Overlord, Enfield 1-1, radio check");
  h.stt->Finish(1, "Overlord, Enfield 1-2, radio check");
  h.stt->Finish(2, "Overlord, Springfield 1-1, radio check");
  h.tts->Finish(0);
  h.tts->Finish(1);
  h.tts->Finish(2);

  // One reply on each frequency; the second reply on kFreq waits.
  assert(h.radio->calls.size() == 2);
  assert(h.radio->calls[0].frequency == kFreq);
  assert(h.radio->calls[1].frequency == kOther);
  assert(h.StateOf("Enfield 1-2") == SessionState::kAwaitingChannel);
  assert(h.dispatcher->arbiter().Waiting(kFreq) == 1);

  h.radio->Finish(0);
  assert(h.radio->calls.size() == 3);
  assert(h.radio->calls[2].frequency == kFreq);
  assert(h.StateOf("Enfield 1-2") == SessionState::kTransmitting);

  h.radio->Finish(1);
  h.radio->Finish(2);
  assert(h.radio->max_in_flight == 2);
  assert(h.dispatcher->stats().replies_sent == 3);
}

void TestHumanTalkerDefersReply() {
  Harness h;
  h.Speak("Enfield 1-1");
  h.stt->Finish(0, "Overlord, Enfield 1-1, radio check");

  h.dispatcher->OnRadioEvent(TransmissionStarted{"Enfield 1-2", kFreq, h.now + 2s});
  h.tts->Finish(0);
  assert(h.radio->calls.empty());
  assert(h.StateOf("Enfield 1-1") == SessionState::kAwaitingChannel);

  // Key-up with no audio ends the talker's exchange and frees the channel.
  h.dispatcher->OnRadioEvent(TransmissionEnded{"Enfield 1-2", kFreq, h.now + 3s});
  assert(h.radio->calls.size() == 1);
}

void TestTranscriptionTimeoutQueuesSayAgain() {
  Harness h;
  h.Speak("Enfield 1-1");
  const auto token = h.stt->calls[0].token;

  h.now += 17s;
  h.dispatcher->Tick(h.now);
  assert(token->cancelled());
  assert(h.dispatcher->stats().sessions_aborted == 1);

  assert(h.tts->calls.size() == 1);
  assert(h.tts->calls[0].script == "Enfield 1-1, Overlord, say again");
  assert(h.StateOf("Enfield 1-1") == SessionState::kSynthesizing);

  // The expired exchange gets nothing more.
  h.stt->Finish(0, "Overlord, Enfield 1-1, radio check");
  assert(h.tts->calls.size() == 1);
  h.dispatcher->OnRadioEvent(AudioReceived{"Enfield 1-1", kFreq, AudioFrame(8, 1), h.now});
  assert(h.dispatcher->stats().events_dropped == 1);

  h.tts->Finish(0);
  h.radio->Finish(0);
  assert(h.dispatcher->stats().replies_sent == 1);
}

void TestChannelWaitTimesOut() {
  Harness h;
  h.dispatcher->OnRadioEvent(TransmissionStarted{"Enfield 1-2", kFreq, h.now});
  h.Speak("Enfield 1-1");
  h.stt->Finish(0, "Overlord, Enfield 1-1, radio check");
  h.tts->Finish(0);
  assert(h.dispatcher->arbiter().Waiting(kFreq) == 1);

  h.now += 21s;
  h.dispatcher->Tick(h.now);
  assert(h.dispatcher->arbiter().Waiting(kFreq) == 0);
  assert(h.dispatcher->stats().sessions_aborted == 2);
  assert(h.radio->calls.empty());
}

void TestUnmonitoredAndDisconnect() {
  Harness h;
  h.dispatcher->OnRadioEvent(TransmissionStarted{"Enfield 1-1", 123000000, h.now});
  assert(h.dispatcher->stats().events_dropped == 1);
  assert(h.dispatcher->ListSessions().empty());

  h.Speak("Enfield 1-1");
  const auto token = h.stt->calls[0].token;
  h.dispatcher->OnRadioEvent(PilotDisconnected{"Enfield 1-1", kFreq, h.now});
  assert(token->cancelled());
  assert(h.dispatcher->ListSessions().empty());
  assert(h.tts->calls.empty());
}

void TestLostKeyUpDoesNotLockTheChannel() {
  Harness h;
  h.dispatcher->OnRadioEvent(TransmissionStarted{"Enfield 1-2", kFreq, h.now});
  h.dispatcher->OnRadioEvent(AudioReceived{"Enfield 1-2", kFreq, AudioFrame(32, 7), h.now + 1s});
  assert(h.dispatcher->arbiter().Busy(kFreq));

  // The key-up never arrives; the stuck-key guard ends the session and the hold.
  h.now += 21s;
  h.dispatcher->Tick(h.now);
  assert(h.dispatcher->ListSessions().empty());
  assert(!h.dispatcher->arbiter().Busy(kFreq));

  h.now += 10min;
  h.Speak("Enfield 1-1");
  h.stt->Finish(0, "Overlord, Enfield 1-1, radio check");
  h.tts->Finish(0);
  assert(h.radio->calls.size() == 1);
  h.radio->Finish(0);
  assert(h.dispatcher->stats().replies_sent == 1);
}

void TestWaiterGrantedWhenStuckTalkerExpires() {
  Harness h;
  h.dispatcher->OnRadioEvent(TransmissionStarted{"Enfield 1-2", kFreq, h.now});

  h.now += 5s;
  h.Speak("Enfield 1-1");
  h.stt->Finish(0, "Overlord, Enfield 1-1, radio check");
  h.tts->Finish(0);
  assert(h.StateOf("Enfield 1-1") == SessionState::kAwaitingChannel);

  h.now += 15s;
  h.dispatcher->Tick(h.now);
  assert(h.radio->calls.size() == 1);
  assert(h.StateOf("Enfield 1-1") == SessionState::kTransmitting);
}

// Speech gateway calls block their own pool, as the factory wires it.
class GatedStt : public awacs::speech::SpeechToText {
 public:
  explicit GatedStt(std::shared_ptr<awacs::runtime::Executor> pool) : pool_(std::move(pool)) {
  }

  void Transcribe(awacs::model::AudioBuffer audio, std::string, awacs::util::Duration, awacs::util::CancellationTokenPtr,
                  awacs::speech::TranscriptionCallback done) override {
    if (audio.at(0).at(0) != kSlow) {
      done(awacs::speech::TranscriptionResult::Success("Overlord, Enfield 2-1, radio check"));
      return;
    }
    pool_->Submit([this, done = std::move(done)] {
      {
        std::unique_lock lock(mutex_);
        ++blocked_;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
      }
      done(awacs::speech::TranscriptionResult::Failure("deadline exceeded"));
    });
  }

  void WaitBlocked(int count) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, 2s, [&] { return blocked_ >= count; });
    assert(blocked_ == count);
  }

  void Open() {
    std::lock_guard lock(mutex_);
    open_ = true;
    cv_.notify_all();
  }

  static constexpr std::uint8_t kSlow = 1;

 private:
  std::shared_ptr<awacs::runtime::Executor> pool_;
  std::mutex                                mutex_;
  std::condition_variable                   cv_;
  int                                       blocked_{0};
  bool                                      open_{false};
};

class RecordingTts : public awacs::speech::TextToSpeech {
 public:
  void Synthesize(std::string script, awacs::util::Duration, awacs::util::CancellationTokenPtr, awacs::speech::SynthesisCallback) override {
    std::lock_guard lock(mutex_);
    scripts_.push_back(std::move(script));
    cv_.notify_all();
  }

  std::vector<std::string> WaitFor(std::size_t count) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, 2s, [&] { return scripts_.size() >= count; });
    return scripts_;
  }

 private:
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::vector<std::string> scripts_;
};

void TestSlowSpeechDoesNotStarveComposition() {
  auto composition = std::make_shared<awacs::runtime::WorkerPool>(1);
  auto speech      = std::make_shared<awacs::runtime::WorkerPool>(4);
  composition->Start();
  speech->Start();

  auto stt   = std::make_shared<GatedStt>(speech);
  auto tts   = std::make_shared<RecordingTts>();
  auto store = std::make_shared<awacs::track::TrackStore>();

  auto replies = std::make_shared<awacs::compose::ReplyBuilder>(std::make_shared<awacs::recognition::IntentClassifier>("Overlord"),
                                                                std::make_shared<awacs::compose::CallComposer>(store, 100.0),
                                                                std::make_shared<awacs::compose::Phraseology>("Overlord"));
  DispatcherOptions options;
  options.frequencies = {kFreq};
  auto dispatcher     = std::make_shared<SessionDispatcher>(options, stt, tts, std::make_shared<FakeRadio>(), replies, composition);

  auto speak = [&](const std::string& pilot, std::uint8_t marker) {
    dispatcher->OnRadioEvent(TransmissionStarted{pilot, kFreq, {}});
    dispatcher->OnRadioEvent(AudioReceived{pilot, kFreq, AudioFrame(8, marker), {}});
    dispatcher->OnRadioEvent(TransmissionEnded{pilot, kFreq, {}});
  };

  // Four transcriptions hold every speech thread.
  for (int i = 1; i <= 4; ++i) {
    speak("Enfield 1-" + std::to_string(i), GatedStt::kSlow);
  }
  stt->WaitBlocked(4);

  speak("Enfield 2-1", 0);
  const auto scripts = tts->WaitFor(1);
  assert(scripts.size() == 1);
  assert(scripts[0] == "Enfield 2-1, Overlord, five by five");

  dispatcher->Shutdown();
  stt->Open();
  speech->Stop();
  composition->Stop();
}

void TestShutdownAbortsEverything() {
  Harness h;
  h.Speak("Enfield 1-1");
  h.Speak("Enfield 1-2");
  assert(h.dispatcher->ListSessions().size() == 2);

  h.dispatcher->Shutdown();
  assert(h.dispatcher->ListSessions().empty());
  assert(h.stt->calls[0].token->cancelled() && h.stt->calls[1].token->cancelled());

  h.Speak("Enfield 1-3");
  assert(h.stt->calls.size() == 2);
  assert(h.tts->calls.empty());
}

} // namespace

int main() {
  TestRadioCheckExchange();
  TestOneTransmitterPerFrequency();
  TestHumanTalkerDefersReply();
  TestTranscriptionTimeoutQueuesSayAgain();
  TestChannelWaitTimesOut();
  TestUnmonitoredAndDisconnect();
  TestLostKeyUpDoesNotLockTheChannel();
  TestWaiterGrantedWhenStuckTalkerExpires();
  TestSlowSpeechDoesNotStarveComposition();
  TestShutdownAbortsEverything();

  std::cout << "awacs_unit_session_dispatcher: pass\n";
  return 0;
}
