#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "internal/util/decimal.hpp"

namespace docflow::util {

/*
  Central error types.

  Domain failures are thrown as these and translated later to gRPC
  status codes. LockAcquisitionTimeout and busy StorageError are the only
  retryable kinds; everything else needs a different request.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTransition : public std::runtime_error {
 public:
  InvalidTransition(std::string from, std::string attempted, const std::string& detail = {});

  const std::string& From() const {
    return from_;
  }
  const std::string& Attempted() const {
    return attempted_;
  }

 private:
  std::string from_;
  std::string attempted_;
};

class QuantityExceeded : public std::runtime_error {
 public:
  QuantityExceeded(std::string product_id, Decimal requested, Decimal remaining);

  const std::string& ProductId() const {
    return product_id_;
  }
  Decimal Requested() const {
    return requested_;
  }
  Decimal Remaining() const {
    return remaining_;
  }

 private:
  std::string product_id_;
  Decimal     requested_;
  Decimal     remaining_;
};

class UnknownProduct : public std::runtime_error {
 public:
  explicit UnknownProduct(std::string product_id);

  const std::string& ProductId() const {
    return product_id_;
  }

 private:
  std::string product_id_;
};

class ReassignmentPolicy : public std::runtime_error {
 public:
  explicit ReassignmentPolicy(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LockAcquisitionTimeout : public std::runtime_error {
 public:
  explicit LockAcquisitionTimeout(std::string lock_key);

  const std::string& LockKey() const {
    return lock_key_;
  }

 private:
  std::string lock_key_;
};

class StorageError : public std::runtime_error {
 public:
  StorageError(const std::string& msg, bool busy) : std::runtime_error(msg), busy_(busy) {
  }

  bool Busy() const {
    return busy_;
  }

 private:
  bool busy_;
};

// True when the same request may succeed if simply retried.
bool IsRetryable(const std::exception& e);

} // namespace docflow::util
