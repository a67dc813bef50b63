#include "internal/lock/lock_reaper.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace docflow::lock {

using observability::IntField;
using observability::StringField;

LockReaper::LockReaper(std::shared_ptr<LockStore> store, LockOptions options, std::chrono::milliseconds interval)
    : store_(std::move(store)), options_(std::move(options)), interval_(interval) {
}

LockReaper::~LockReaper() {
  Stop();
}

void LockReaper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&LockReaper::Run, this);
}

void LockReaper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

std::uint64_t LockReaper::ReapOnce() {
  const auto now_ms = util::ToUnixMillis(util::Now());
  const auto ttl_ms = static_cast<std::uint64_t>(options_.ttl.count());
  if (now_ms <= ttl_ms) return 0;

  std::uint64_t reaped = 0;
  const auto    result = store_->ReapExpired(options_.region, now_ms - ttl_ms, &reaped);
  if (!result) {
    DOCFLOW_LOG_WARN("lock reaper pass failed", {StringField("region", options_.region), StringField("error", result.message)});
    return 0;
  }
  if (reaped > 0) {
    DOCFLOW_LOG_INFO("reaped abandoned locks", {StringField("region", options_.region), IntField("count", static_cast<std::int64_t>(reaped))});
  }
  return reaped;
}

void LockReaper::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, interval_, [this] { return !running_; });
    if (!running_) break;

    lock.unlock();
    try {
      ReapOnce();
    } catch (const std::exception& e) {
      DOCFLOW_LOG_ERROR("lock reaper pass threw", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace docflow::lock
