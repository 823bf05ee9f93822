#pragma once

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "awacs/v1.hpp"
#include "internal/runtime/executor.hpp"
#include "internal/speech/speech.hpp"

namespace awacs::speech {

struct SpeechGatewayOptions {
  std::string api_key;
  std::string voice{"alloy"};
  double      speed{1.0};
};

/*
  Speech collaborators backed by the SpeechGateway gRPC service.

  Each call runs a blocking unary RPC on the executor, which should be
  a pool of its own so slow calls never queue ahead of composition. The session
  timeout becomes the RPC deadline and cancellation maps to
  ClientContext::TryCancel().
*/
class GrpcSpeechGateway final : public SpeechToText, public TextToSpeech {
 public:
  GrpcSpeechGateway(std::shared_ptr<grpc::Channel> channel, std::shared_ptr<runtime::Executor> executor, SpeechGatewayOptions options);

  void Transcribe(awacs::model::AudioBuffer audio, std::string language, util::Duration timeout, util::CancellationTokenPtr token,
                  TranscriptionCallback done) override;

  void Synthesize(std::string script, util::Duration timeout, util::CancellationTokenPtr token, SynthesisCallback done) override;

 private:
  std::shared_ptr<grpc::ClientContext> MakeContext(util::Duration timeout, const util::CancellationTokenPtr& token) const;

  std::shared_ptr<awacs::v1::SpeechGateway::Stub> stub_;
  std::shared_ptr<runtime::Executor>              executor_;
  SpeechGatewayOptions                            options_;
};

} // namespace awacs::speech
