#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace docflow::runtime {

struct ServerOptions {
  // host:port; port 0 asks the OS for a free one
  std::string bind_address;

  // In-flight RPCs may still be waiting on a business-key lock at
  // shutdown; they get this long before being cancelled.
  std::chrono::milliseconds shutdown_grace{5'000};
};

/*
  Hosts the gRPC services built by factory::Build.

  The server owns the service objects: grpc::ServerBuilder only borrows
  them, so they have to outlive the grpc::Server, which Stop() and the
  destructor guarantee by tearing the grpc::Server down first.
*/
class Server {
 public:
  Server(ServerOptions options, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // Throws std::runtime_error when the address cannot be bound.
  void Start();
  void Wait();
  void Stop();

  // Port actually bound by Start(); 0 before that.
  int BoundPort() const {
    return bound_port_;
  }

 private:
  ServerOptions                                 options_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           bound_port_ = 0;
};

} // namespace docflow::runtime
