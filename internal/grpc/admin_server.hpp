#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "awacs/v1.hpp"
#include "internal/service/admin_service.hpp"

namespace awacs::grpc {

class AdminServer final : public awacs::v1::ControllerAdmin::Service {
 public:
  explicit AdminServer(std::shared_ptr<awacs::service::AdminService> svc);

  ::grpc::Status GetPicture(::grpc::ServerContext*, const awacs::v1::GetPictureRequest*, awacs::v1::GetPictureResponse*) override;
  ::grpc::Status ListSessions(::grpc::ServerContext*, const awacs::v1::ListSessionsRequest*, awacs::v1::ListSessionsResponse*) override;
  ::grpc::Status GetStats(::grpc::ServerContext*, const awacs::v1::GetStatsRequest*, awacs::v1::GetStatsResponse*) override;
  ::grpc::Status ComposeCall(::grpc::ServerContext*, const awacs::v1::ComposeCallRequest*, awacs::v1::ComposeCallResponse*) override;

 private:
  std::shared_ptr<awacs::service::AdminService> service_;
};

} // namespace awacs::grpc
