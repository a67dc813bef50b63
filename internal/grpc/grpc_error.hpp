#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

#include "internal/util/errors.hpp"

namespace docflow::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  ABORTED and UNAVAILABLE are the retryable outcomes (lock wait exhausted,
  storage busy); clients should treat every other code as final for the
  request as sent.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace docflow::grpc
