#include "internal/speech/grpc_speech_gateway.hpp"

#include <chrono>
#include <utility>

namespace awacs::speech {

GrpcSpeechGateway::GrpcSpeechGateway(std::shared_ptr<grpc::Channel> channel, std::shared_ptr<runtime::Executor> executor,
                                     SpeechGatewayOptions options)
    : stub_(awacs::v1::SpeechGateway::NewStub(std::move(channel))), executor_(std::move(executor)), options_(std::move(options)) {
}

std::shared_ptr<grpc::ClientContext> GrpcSpeechGateway::MakeContext(util::Duration timeout, const util::CancellationTokenPtr& token) const {
  auto context = std::make_shared<grpc::ClientContext>();
  context->set_deadline(std::chrono::system_clock::now() + timeout);
  if (!options_.api_key.empty()) {
    context->AddMetadata("authorization", "Bearer " + options_.api_key);
  }
  if (token) {
    // weak_ptr: the hook may fire after the RPC finished and released the context.
    std::weak_ptr<grpc::ClientContext> weak = context;
    token->OnCancel([weak] {
      if (auto ctx = weak.lock()) {
        ctx->TryCancel();
      }
    });
  }
  return context;
}

void GrpcSpeechGateway::Transcribe(awacs::model::AudioBuffer audio, std::string language, util::Duration timeout, util::CancellationTokenPtr token,
                                   TranscriptionCallback done) {
  auto stub = stub_;
  auto task = [this, stub, audio = std::move(audio), language = std::move(language), timeout, token = std::move(token),
               done = std::move(done)]() mutable {
    if (token && token->cancelled()) {
      done(TranscriptionResult::Failure("cancelled"));
      return;
    }

    awacs::v1::TranscribeRequest request;
    request.set_language(language);
    for (auto& frame : audio) {
      request.add_frames(std::string(frame.begin(), frame.end()));
    }

    auto                          context = MakeContext(timeout, token);
    awacs::v1::TranscribeResponse response;
    const auto                    status = stub->Transcribe(context.get(), request, &response);
    if (!status.ok()) {
      done(TranscriptionResult::Failure("transcribe: " + status.error_message()));
      return;
    }
    done(TranscriptionResult::Success(response.text()));
  };
  executor_->Submit(std::move(task));
}

void GrpcSpeechGateway::Synthesize(std::string script, util::Duration timeout, util::CancellationTokenPtr token, SynthesisCallback done) {
  auto stub = stub_;
  auto task = [this, stub, script = std::move(script), timeout, token = std::move(token), done = std::move(done)]() mutable {
    if (token && token->cancelled()) {
      done(SynthesisResult::Failure("cancelled"));
      return;
    }

    awacs::v1::SynthesizeRequest request;
    request.set_text(script);
    request.set_voice(options_.voice);
    request.set_speed(options_.speed);

    auto                          context = MakeContext(timeout, token);
    awacs::v1::SynthesizeResponse response;
    const auto                    status = stub->Synthesize(context.get(), request, &response);
    if (!status.ok()) {
      done(SynthesisResult::Failure("synthesize: " + status.error_message()));
      return;
    }

    awacs::model::AudioBuffer frames;
    frames.reserve(static_cast<std::size_t>(response.frames_size()));
    for (const auto& frame : response.frames()) {
      frames.emplace_back(frame.begin(), frame.end());
    }
    done(SynthesisResult::Success(std::move(frames)));
  };
  executor_->Submit(std::move(task));
}

} // namespace awacs::speech
