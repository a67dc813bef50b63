#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/lock/lock_service.hpp"
#include "internal/lock/lock_store.hpp"

namespace docflow::lock {

/*
  Background worker that deletes abandoned lock rows.

  Acquire already takes over stale rows on contact; the reaper only keeps
  the table from accumulating rows for keys nobody asks for again (a
  holder that crashed while holding quotation:N, say).
*/
class LockReaper {
 public:
  LockReaper(std::shared_ptr<LockStore> store, LockOptions options, std::chrono::milliseconds interval);
  ~LockReaper();

  void Start();
  void Stop();

  // One pass; returns how many rows were removed.
  std::uint64_t ReapOnce();

 private:
  void Run();

  std::shared_ptr<LockStore> store_;
  LockOptions                options_;
  std::chrono::milliseconds  interval_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
};

} // namespace docflow::lock
