#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/compose/call_composer.hpp"
#include "internal/compose/phraseology.hpp"
#include "internal/model/radio.hpp"
#include "internal/recognition/intent_classifier.hpp"

namespace awacs::compose {

enum class ReplyKind : std::uint8_t {
  kBogeyDope,
  kClean,
  kRadioCheck,
  kNoTrack,
  kNotFriendly,
  kSayAgain,
};

std::string_view ToString(ReplyKind kind);

ReplyKind KindOf(const awacs::model::CallOutcome& outcome);

struct Reply {
  std::string addressee;
  std::string script;
  ReplyKind   kind{ReplyKind::kSayAgain};
};

/*
  Transcript in, reply script out: classify, compose, render.

  Radio-flow errors become replies here (no track, not friendly,
  say again); a transcript addressed to someone else yields nullopt.
*/
class ReplyBuilder {
 public:
  ReplyBuilder(std::shared_ptr<const recognition::IntentClassifier> classifier, std::shared_ptr<const CallComposer> composer,
               std::shared_ptr<const Phraseology> phraseology);

  std::optional<Reply> Build(const awacs::model::PilotId& radio_identity, std::string_view transcript, util::SteadyTime transmission_start) const;

  Reply BuildFor(const awacs::model::RadioRequest& request) const;

  Reply SayAgain(std::string_view addressee) const;

 private:
  std::shared_ptr<const recognition::IntentClassifier> classifier_;
  std::shared_ptr<const CallComposer>                  composer_;
  std::shared_ptr<const Phraseology>                   phraseology_;
};

} // namespace awacs::compose
