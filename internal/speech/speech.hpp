#pragma once

#include <functional>
#include <string>

#include "internal/model/radio.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/time.hpp"

namespace awacs::speech {

// Outcome of one speech-to-text call. Never thrown across threads.
struct TranscriptionResult {
  bool        ok{false};
  std::string text;
  std::string error;

  static TranscriptionResult Success(std::string text) {
    return {true, std::move(text), {}};
  }

  static TranscriptionResult Failure(std::string error) {
    return {false, {}, std::move(error)};
  }
};

struct SynthesisResult {
  bool                      ok{false};
  awacs::model::AudioBuffer frames;
  std::string               error;

  static SynthesisResult Success(awacs::model::AudioBuffer frames) {
    return {true, std::move(frames), {}};
  }

  static SynthesisResult Failure(std::string error) {
    return {false, {}, std::move(error)};
  }
};

using TranscriptionCallback = std::function<void(TranscriptionResult)>;
using SynthesisCallback     = std::function<void(SynthesisResult)>;

/*
  Asynchronous speech collaborators.

  `done` is invoked exactly once, on any thread, possibly before the call
  returns. A cancelled call may still complete; the caller discards it.
  Neither call retries: the session decides whether to try again.
*/
class SpeechToText {
 public:
  virtual ~SpeechToText() = default;

  virtual void Transcribe(awacs::model::AudioBuffer audio, std::string language, util::Duration timeout, util::CancellationTokenPtr token,
                          TranscriptionCallback done) = 0;
};

class TextToSpeech {
 public:
  virtual ~TextToSpeech() = default;

  virtual void Synthesize(std::string script, util::Duration timeout, util::CancellationTokenPtr token, SynthesisCallback done) = 0;
};

} // namespace awacs::speech
