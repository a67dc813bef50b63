#include "internal/db/api/result.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace docflow::db {

std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

void ThrowIfFailed(const Result& result, std::string_view what) {
  if (result) {
    return;
  }

  std::string msg(what);
  msg += ": ";
  msg += ToString(result.code);
  if (!result.message.empty()) {
    msg += " (" + result.message + ")";
  }

  if (result.code == ErrorCode::NotFound) {
    throw util::NotFound(msg);
  }
  const bool busy = result.code == ErrorCode::Busy || result.code == ErrorCode::SerializationFailure;
  throw util::StorageError(msg, busy);
}

} // namespace docflow::db
