#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace awacs::runtime {

Server::Server(std::string bind_address, std::vector<std::shared_ptr<grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Shutdown();
}

void Server::Start() {
  grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, grpc::InsecureServerCredentials());

  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_) {
    throw std::runtime_error("failed to start admin server on " + bind_address_);
  }

  AWACS_LOG_INFO("admin server listening", {awacs::observability::StringField("address", bind_address_)});
}

void Server::Wait() {
  if (grpc_server_) {
    grpc_server_->Wait();
  }
}

void Server::Shutdown() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace awacs::runtime
