#include "internal/compose/reply_builder.hpp"

#include <variant>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace awacs::compose {

using awacs::observability::StringField;

std::string_view ToString(ReplyKind kind) {
  switch (kind) {
    case ReplyKind::kBogeyDope:
      return "bogey_dope";
    case ReplyKind::kClean:
      return "clean";
    case ReplyKind::kRadioCheck:
      return "radio_check";
    case ReplyKind::kNoTrack:
      return "no_track";
    case ReplyKind::kNotFriendly:
      return "not_friendly";
    case ReplyKind::kSayAgain:
      return "say_again";
  }
  return "say_again";
}

ReplyKind KindOf(const awacs::model::CallOutcome& outcome) {
  struct Visitor {
    ReplyKind operator()(const awacs::model::BogeyDopeCall&) const {
      return ReplyKind::kBogeyDope;
    }
    ReplyKind operator()(const awacs::model::CleanCall&) const {
      return ReplyKind::kClean;
    }
    ReplyKind operator()(const awacs::model::RadioCheckCall&) const {
      return ReplyKind::kRadioCheck;
    }
  };
  return std::visit(Visitor{}, outcome);
}

ReplyBuilder::ReplyBuilder(std::shared_ptr<const recognition::IntentClassifier> classifier, std::shared_ptr<const CallComposer> composer,
                           std::shared_ptr<const Phraseology> phraseology)
    : classifier_(std::move(classifier)), composer_(std::move(composer)), phraseology_(std::move(phraseology)) {
}

std::optional<Reply> ReplyBuilder::Build(const awacs::model::PilotId& radio_identity, std::string_view transcript,
                                         util::SteadyTime transmission_start) const {
  std::optional<awacs::model::RadioRequest> request;
  try {
    request = classifier_->Classify(transcript, radio_identity, transmission_start);
  } catch (const util::UnrecognizedRequest& e) {
    AWACS_LOG_INFO("unrecognized request",
                   {StringField("pilot", radio_identity), StringField("transcript", transcript), StringField("reason", e.what())});
    return SayAgain(classifier_->ReplyAddressee(transcript, radio_identity));
  }

  if (!request) {
    AWACS_LOG_INFO("transmission not addressed to controller", {StringField("pilot", radio_identity), StringField("transcript", transcript)});
    return std::nullopt;
  }
  return BuildFor(*request);
}

Reply ReplyBuilder::BuildFor(const awacs::model::RadioRequest& request) const {
  Reply reply;
  reply.addressee = request.pilot;

  try {
    const auto outcome = composer_->Compose(request);
    reply.script       = phraseology_->Render(request.pilot, outcome);
    reply.kind         = KindOf(outcome);
  } catch (const util::RequesterNotFound& e) {
    AWACS_LOG_INFO("requester not on scope", {StringField("pilot", request.pilot), StringField("reason", e.what())});
    reply.script = phraseology_->NoTrack(request.pilot);
    reply.kind   = ReplyKind::kNoTrack;
  } catch (const util::RequesterNotFriendly& e) {
    AWACS_LOG_INFO("requester not friendly", {StringField("pilot", request.pilot), StringField("reason", e.what())});
    reply.script = phraseology_->NotFriendly(request.pilot);
    reply.kind   = ReplyKind::kNotFriendly;
  }
  return reply;
}

Reply ReplyBuilder::SayAgain(std::string_view addressee) const {
  Reply reply;
  reply.addressee = std::string(addressee);
  reply.script    = phraseology_->SayAgain(addressee);
  reply.kind      = ReplyKind::kSayAgain;
  return reply;
}

} // namespace awacs::compose
