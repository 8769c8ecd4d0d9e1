#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace rentledger::runtime {

class Server {
public:
  Server(rentledger::runtime::config::ServerConfig config, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

private:
  std::shared_ptr<::grpc::ServerCredentials> Credentials() const;

  rentledger::runtime::config::ServerConfig config_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server> grpc_server_;
};

} // namespace rentledger::runtime
