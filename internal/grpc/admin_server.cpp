#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace awacs::grpc {

using namespace awacs::v1;

AdminServer::AdminServer(std::shared_ptr<awacs::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetPicture(::grpc::ServerContext*, const GetPictureRequest* req, GetPictureResponse* resp) {
  try {
    *resp = service_->GetPicture(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListSessions(::grpc::ServerContext*, const ListSessionsRequest* req, ListSessionsResponse* resp) {
  try {
    *resp = service_->ListSessions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetStats(::grpc::ServerContext*, const GetStatsRequest* req, GetStatsResponse* resp) {
  try {
    *resp = service_->GetStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ComposeCall(::grpc::ServerContext*, const ComposeCallRequest* req, ComposeCallResponse* resp) {
  try {
    *resp = service_->ComposeCall(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace awacs::grpc
