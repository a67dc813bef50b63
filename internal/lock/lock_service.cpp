#include "internal/lock/lock_service.hpp"

#include <algorithm>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace docflow::lock {

using observability::IntField;
using observability::StringField;

namespace {

// "quotation:42" -> "quotation"
void ObserveWait(const std::string& lock_key, std::chrono::steady_clock::time_point started, bool acquired) {
  const auto entity  = lock_key.substr(0, lock_key.find(':'));
  const auto wait_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveLockWaitMs(entity, wait_ms, acquired);
}

} // namespace

LockService::LockService(std::shared_ptr<LockStore> store, LockOptions options)
    : store_(std::move(store)), options_(std::move(options)), client_id_(util::ToString(util::GenerateUUID())) {
  if (!store_) {
    throw std::invalid_argument("LockService requires a lock store");
  }
  if (options_.poll_interval.count() <= 0) {
    options_.poll_interval = std::chrono::milliseconds(1);
  }
}

std::string LockService::QuotationKey(std::uint64_t quotation_id) {
  return "quotation:" + std::to_string(quotation_id);
}

std::string LockService::InvoiceKey(std::uint64_t invoice_id) {
  return "invoice:" + std::to_string(invoice_id);
}

std::string LockService::ProjectKey(std::uint64_t project_id) {
  return "project:" + std::to_string(project_id);
}

std::string LockService::NextHolderId() {
  return client_id_ + "/" + std::to_string(sequence_.fetch_add(1) + 1);
}

LockHandle LockService::Acquire(const std::string& lock_key) {
  return Acquire(lock_key, options_.wait_timeout);
}

LockHandle LockService::Acquire(const std::string& lock_key, std::chrono::milliseconds wait_timeout) {
  const auto started  = std::chrono::steady_clock::now();
  const auto deadline = started + wait_timeout;
  const auto ttl_ms   = static_cast<std::uint64_t>(options_.ttl.count());

  LockRecord record;
  record.lock_key  = lock_key;
  record.region    = options_.region;
  record.holder_id = NextHolderId();

  std::uint64_t attempts = 0;
  for (;;) {
    const auto now = util::Now();
    record.created_at_ms = util::ToUnixMillis(now);

    // anything created before this instant is abandoned
    const std::uint64_t stale_before = record.created_at_ms > ttl_ms ? record.created_at_ms - ttl_ms : 0;

    ++attempts;
    const auto result = store_->TryInsert(record, stale_before);
    if (result) {
      ObserveWait(lock_key, started, true);
      DOCFLOW_LOG_DEBUG("lock acquired", {StringField("lock_key", lock_key), StringField("holder", record.holder_id),
                                          IntField("attempts", static_cast<std::int64_t>(attempts))});
      return LockHandle{record.lock_key, record.region, record.holder_id, now};
    }

    if (result.code != db::ErrorCode::Conflict && result.code != db::ErrorCode::Busy) {
      db::ThrowIfFailed(result, "acquire lock " + lock_key);
    }

    const auto remaining = deadline - std::chrono::steady_clock::now();
    if (remaining <= std::chrono::steady_clock::duration::zero()) {
      ObserveWait(lock_key, started, false);
      DOCFLOW_LOG_WARN("lock acquisition timed out", {StringField("lock_key", lock_key), IntField("wait_ms", wait_timeout.count()),
                                                      IntField("attempts", static_cast<std::int64_t>(attempts))});
      throw util::LockAcquisitionTimeout(lock_key);
    }

    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(options_.poll_interval, remaining));
  }
}

void LockService::Release(const LockHandle& handle) noexcept {
  try {
    const auto held = util::Now() - handle.acquired_at;
    if (held > options_.ttl) {
      DOCFLOW_LOG_WARN("lock held beyond ttl; it may already belong to another holder",
                       {StringField("lock_key", handle.lock_key),
                        IntField("held_ms", std::chrono::duration_cast<std::chrono::milliseconds>(held).count())});
    }

    const auto result = store_->Delete(handle.lock_key, handle.region, handle.holder_id);
    if (!result) {
      DOCFLOW_LOG_WARN("lock release failed; the row will expire after ttl",
                       {StringField("lock_key", handle.lock_key), StringField("error", result.message)});
      return;
    }
    DOCFLOW_LOG_DEBUG("lock released", {StringField("lock_key", handle.lock_key), StringField("holder", handle.holder_id)});
  } catch (const std::exception& e) {
    DOCFLOW_LOG_WARN("lock release threw; the row will expire after ttl",
                     {StringField("lock_key", handle.lock_key), StringField("error", e.what())});
  } catch (...) {
    DOCFLOW_LOG_WARN("lock release threw a non-standard exception; the row will expire after ttl",
                     {StringField("lock_key", handle.lock_key)});
  }
}

} // namespace docflow::lock
