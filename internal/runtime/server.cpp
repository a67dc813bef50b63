#include "server.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace docflow::runtime {

using observability::IntField;
using observability::StringField;

Server::Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {
  if (options_.bind_address.empty()) {
    throw std::invalid_argument("server bind address is empty");
  }
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) {
    return;
  }

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, ::grpc::InsecureServerCredentials(), &bound_port_);
  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || bound_port_ == 0) {
    grpc_server_.reset();
    bound_port_ = 0;
    throw std::runtime_error("failed to start gRPC server on " + options_.bind_address);
  }

  DOCFLOW_LOG_INFO("gRPC server listening", {StringField("bind_address", options_.bind_address), IntField("port", bound_port_),
                                             IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_) {
    grpc_server_->Wait();
  }
}

void Server::Stop() {
  if (!grpc_server_) {
    return;
  }
  grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
  grpc_server_.reset();
  bound_port_ = 0;
  DOCFLOW_LOG_INFO("gRPC server stopped", {StringField("bind_address", options_.bind_address)});
}

} // namespace docflow::runtime
