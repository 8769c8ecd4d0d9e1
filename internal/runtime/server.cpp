#include "server.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace rentledger::runtime {

namespace {

std::string ReadPem(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to read " + path);
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

} // namespace

Server::Server(rentledger::runtime::config::ServerConfig config, std::vector<std::unique_ptr<::grpc::Service>> services)
    : config_(std::move(config)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

std::shared_ptr<::grpc::ServerCredentials> Server::Credentials() const {
  if (!config_.has_tls()) {
    RENTLEDGER_LOG_WARN("gRPC server has no TLS, callers prove no identity",
                        {observability::BoolField("trust_principal_metadata", config_.trust_principal_metadata())});
    return ::grpc::InsecureServerCredentials();
  }

  const auto& tls = config_.tls();
  if (tls.cert_chain_path().empty() || tls.private_key_path().empty() || tls.client_ca_path().empty()) {
    throw std::runtime_error("server.tls needs cert_chain_path, private_key_path and client_ca_path");
  }

  ::grpc::SslServerCredentialsOptions options(GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY);
  options.pem_root_certs = ReadPem(tls.client_ca_path());
  options.pem_key_cert_pairs.push_back({ReadPem(tls.private_key_path()), ReadPem(tls.cert_chain_path())});
  return ::grpc::SslServerCredentials(options);
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(config_.bind_address(), Credentials());

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + config_.bind_address());
  }

  RENTLEDGER_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", config_.bind_address()),
                                                observability::BoolField("tls", config_.has_tls()),
                                                observability::IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace rentledger::runtime
