#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/lock/lock_store.hpp"
#include "internal/util/time.hpp"

namespace docflow::lock {

struct LockOptions {
  // Rows older than this are abandoned and may be taken over.
  std::chrono::milliseconds ttl{30'000};

  // Default bound on how long Acquire polls before giving up.
  std::chrono::milliseconds wait_timeout{5'000};

  std::chrono::milliseconds poll_interval{100};

  std::string region{"DEFAULT"};
};

struct LockHandle {
  std::string     lock_key;
  std::string     region;
  std::string     holder_id;
  util::TimePoint acquired_at;
};

/*
  Named mutual exclusion on top of a LockStore.

  Acquire inserts a lock row, polling while another live holder owns the
  key, and throws util::LockAcquisitionTimeout once the wait budget is
  spent. Release never throws: a lock that expired and was claimed by
  someone else is left alone, since every acquisition has its own
  holder id.

  Not re-entrant. A thread that acquires the same key twice waits on
  itself until the timeout.
*/
class LockService {
 public:
  LockService(std::shared_ptr<LockStore> store, LockOptions options = {});

  LockHandle Acquire(const std::string& lock_key);
  LockHandle Acquire(const std::string& lock_key, std::chrono::milliseconds wait_timeout);

  void Release(const LockHandle& handle) noexcept;

  template <typename Fn>
  std::invoke_result_t<Fn> RunExclusive(const std::string& lock_key, Fn&& fn);

  template <typename Fn>
  std::invoke_result_t<Fn> WithQuotationLock(std::uint64_t quotation_id, Fn&& fn) {
    return RunExclusive(QuotationKey(quotation_id), std::forward<Fn>(fn));
  }

  template <typename Fn>
  std::invoke_result_t<Fn> WithInvoiceLock(std::uint64_t invoice_id, Fn&& fn) {
    return RunExclusive(InvoiceKey(invoice_id), std::forward<Fn>(fn));
  }

  // Serializes version numbering within a project. Never taken while a
  // quotation or invoice lock is held.
  template <typename Fn>
  std::invoke_result_t<Fn> WithProjectLock(std::uint64_t project_id, Fn&& fn) {
    return RunExclusive(ProjectKey(project_id), std::forward<Fn>(fn));
  }

  static std::string QuotationKey(std::uint64_t quotation_id);
  static std::string InvoiceKey(std::uint64_t invoice_id);
  static std::string ProjectKey(std::uint64_t project_id);

  const LockOptions& Options() const {
    return options_;
  }

  const std::string& ClientId() const {
    return client_id_;
  }

 private:
  std::string NextHolderId();

  std::shared_ptr<LockStore> store_;
  LockOptions                options_;
  std::string                client_id_;
  std::atomic<std::uint64_t> sequence_{0};
};

/*
  Releases a held lock when the scope ends, on every exit path.
*/
class ScopedLock {
 public:
  ScopedLock(LockService& service, LockHandle handle) : service_(&service), handle_(std::move(handle)) {
  }

  ~ScopedLock() {
    service_->Release(handle_);
  }

  ScopedLock(const ScopedLock&)            = delete;
  ScopedLock& operator=(const ScopedLock&) = delete;

  const LockHandle& Handle() const {
    return handle_;
  }

 private:
  LockService* service_;
  LockHandle   handle_;
};

template <typename Fn>
std::invoke_result_t<Fn> LockService::RunExclusive(const std::string& lock_key, Fn&& fn) {
  ScopedLock held(*this, Acquire(lock_key));
  return std::invoke(std::forward<Fn>(fn));
}

} // namespace docflow::lock
