#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace docflow::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace docflow::util;

  if (dynamic_cast<const LockAcquisitionTimeout*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const InvalidTransition*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ReassignmentPolicy*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const QuantityExceeded*>(&e)) {
    return {::grpc::StatusCode::OUT_OF_RANGE, e.what()};
  }
  if (dynamic_cast<const UnknownProduct*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (const auto* storage = dynamic_cast<const StorageError*>(&e)) {
    return {storage->Busy() ? ::grpc::StatusCode::UNAVAILABLE : ::grpc::StatusCode::INTERNAL, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace docflow::grpc
