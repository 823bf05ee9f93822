#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

namespace awacs::runtime {

/*
  gRPC host for the admin surface.
*/
class Server {
 public:
  Server(std::string bind_address, std::vector<std::shared_ptr<grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Shutdown();

  const std::string& bind_address() const {
    return bind_address_;
  }

 private:
  std::string                                 bind_address_;
  std::vector<std::shared_ptr<grpc::Service>> services_;
  std::unique_ptr<grpc::Server>               grpc_server_;
};

} // namespace awacs::runtime
