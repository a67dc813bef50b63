#pragma once

#include <string>
#include <string_view>

namespace docflow::db {

/*
  Portable DB result codes.

  The repository and lock-store layers must translate backend errors into
  these. Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

std::string_view ToString(ErrorCode code);

/*
  Converts a failing Result into the exception taxonomy:
  NotFound -> util::NotFound, everything else -> util::StorageError
  (busy / serialization failures are flagged retryable).
*/
void ThrowIfFailed(const Result& result, std::string_view what);

} // namespace docflow::db
