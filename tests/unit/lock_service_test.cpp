#include "internal/lock/lock_service.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/lock/lock_reaper.hpp"
#include "internal/lock/memory_lock_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using docflow::lock::LockOptions;
using docflow::lock::LockRecord;
using docflow::lock::LockService;
using docflow::lock::MemoryLockStore;
using Clock = std::chrono::steady_clock;

LockOptions FastOptions() {
  LockOptions options;
  options.ttl           = std::chrono::milliseconds(30'000);
  options.wait_timeout  = std::chrono::milliseconds(200);
  options.poll_interval = std::chrono::milliseconds(5);
  return options;
}

void TestMutualExclusion() {
  auto store           = std::make_shared<MemoryLockStore>();
  auto options         = FastOptions();
  options.wait_timeout = std::chrono::milliseconds(5'000);
  LockService locks(store, options);

  std::atomic<int> inside{0};
  int              counter = 0;

  std::vector<std::thread> workers;
  for (int t = 0; t < 4; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < 25; ++i) {
        locks.RunExclusive(LockService::QuotationKey(1), [&] {
          assert(inside.fetch_add(1) == 0);
          ++counter;
          inside.fetch_sub(1);
        });
      }
    });
  }
  for (auto& w : workers) w.join();

  assert(counter == 100);
  assert(store->Size() == 0);
}

void TestTimeoutRespectsBound() {
  auto        store = std::make_shared<MemoryLockStore>();
  LockService locks(store, FastOptions());

  auto held = locks.Acquire(LockService::QuotationKey(7));

  const auto started   = Clock::now();
  bool       timed_out = false;
  try {
    locks.Acquire(LockService::QuotationKey(7), std::chrono::milliseconds(100));
  } catch (const docflow::util::LockAcquisitionTimeout& e) {
    timed_out = true;
    assert(e.LockKey() == "quotation:7");
    assert(docflow::util::IsRetryable(e));
  }
  const auto waited = Clock::now() - started;

  assert(timed_out);
  assert(waited >= std::chrono::milliseconds(100));
  // one poll interval of slack plus scheduling noise
  assert(waited < std::chrono::milliseconds(1000));

  locks.Release(held);
}

void TestKeysAreIndependent() {
  auto        store = std::make_shared<MemoryLockStore>();
  LockService locks(store, FastOptions());

  auto quotation = locks.Acquire(LockService::QuotationKey(1));
  auto other     = locks.Acquire(LockService::QuotationKey(2));
  auto invoice   = locks.Acquire(LockService::InvoiceKey(1));
  assert(store->Size() == 3);

  locks.Release(invoice);
  locks.Release(other);
  locks.Release(quotation);
  assert(store->Size() == 0);
}

void TestReleasedOnException() {
  auto        store = std::make_shared<MemoryLockStore>();
  LockService locks(store, FastOptions());

  bool threw = false;
  try {
    locks.WithQuotationLock(3, [] { throw std::runtime_error("boom"); });
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!store->Get(LockService::QuotationKey(3), "DEFAULT").has_value());

  const int value = locks.WithQuotationLock(3, [] { return 42; });
  assert(value == 42);
}

void TestStaleLockIsTakenOver() {
  auto store   = std::make_shared<MemoryLockStore>();
  auto options = FastOptions();
  options.ttl  = std::chrono::milliseconds(50);

  LockService locks(store, options);

  // a holder that crashed a while ago
  const auto now = docflow::util::ToUnixMillis(docflow::util::Now());
  assert(store->TryInsert(LockRecord{"quotation:9", "DEFAULT", "crashed", now - 10'000}, 0));

  auto handle = locks.Acquire(LockService::QuotationKey(9));
  assert(store->Get("quotation:9", "DEFAULT")->holder_id == handle.holder_id);
  locks.Release(handle);
}

void TestReleaseAfterTakeoverIsNoop() {
  auto store   = std::make_shared<MemoryLockStore>();
  auto options = FastOptions();
  options.ttl  = std::chrono::milliseconds(30);

  LockService slow(store, options);
  LockService fast(store, options);

  auto stale = slow.Acquire(LockService::QuotationKey(4));
  std::this_thread::sleep_for(std::chrono::milliseconds(60));

  auto fresh = fast.Acquire(LockService::QuotationKey(4));
  assert(fresh.holder_id != stale.holder_id);

  // the original holder finishing late must not free the new owner's lock
  slow.Release(stale);
  auto row = store->Get("quotation:4", "DEFAULT");
  assert(row.has_value());
  assert(row->holder_id == fresh.holder_id);

  fast.Release(fresh);
  assert(!store->Get("quotation:4", "DEFAULT").has_value());
}

void TestHolderIdsAreUnique() {
  auto        store = std::make_shared<MemoryLockStore>();
  LockService locks(store, FastOptions());

  auto a = locks.Acquire(LockService::QuotationKey(1));
  locks.Release(a);
  auto b = locks.Acquire(LockService::QuotationKey(1));
  locks.Release(b);
  assert(a.holder_id != b.holder_id);
}

// Claims like a memory store but fails every Delete.
class FailingReleaseStore : public docflow::lock::LockStore {
 public:
  explicit FailingReleaseStore(bool standard) : standard_(standard) {
  }

  docflow::db::Result TryInsert(const LockRecord& record, std::uint64_t stale_before_ms) override {
    return inner_.TryInsert(record, stale_before_ms);
  }

  docflow::db::Result Delete(const std::string&, const std::string&, const std::string&) override {
    ++deletes;
    if (standard_) {
      throw std::runtime_error("connection reset");
    }
    throw 42;
  }

  std::optional<LockRecord> Get(const std::string& lock_key, const std::string& region) override {
    return inner_.Get(lock_key, region);
  }

  docflow::db::Result ReapExpired(const std::string& region, std::uint64_t stale_before_ms, std::uint64_t* reaped) override {
    return inner_.ReapExpired(region, stale_before_ms, reaped);
  }

  int deletes = 0;

 private:
  bool            standard_;
  MemoryLockStore inner_;
};

void TestReleaseNeverThrows() {
  for (const bool standard : {true, false}) {
    auto        store = std::make_shared<FailingReleaseStore>(standard);
    LockService locks(store, FastOptions());

    const int result = locks.RunExclusive(LockService::QuotationKey(3), [] { return 7; });
    assert(result == 7);
    assert(store->deletes == 1);

    // the row outlives the failed release and blocks until it goes stale
    assert(store->Get(LockService::QuotationKey(3), "DEFAULT").has_value());
  }
}

void TestProjectKeysAreSeparateFromQuotations() {
  auto        store = std::make_shared<MemoryLockStore>();
  LockService locks(store, FastOptions());

  assert(LockService::ProjectKey(5) == "project:5");
  locks.WithProjectLock(5, [&] {
    locks.WithQuotationLock(5, [&] { assert(store->Size() == 2); });
  });
  assert(store->Size() == 0);
}

void TestReaperRemovesOnlyStaleRows() {
  auto store   = std::make_shared<MemoryLockStore>();
  auto options = FastOptions();

  const auto now = docflow::util::ToUnixMillis(docflow::util::Now());
  assert(store->TryInsert(LockRecord{"quotation:1", "DEFAULT", "old", now - 60'000}, 0));
  assert(store->TryInsert(LockRecord{"quotation:2", "DEFAULT", "live", now}, 0));
  assert(store->TryInsert(LockRecord{"quotation:3", "OTHER", "old", now - 60'000}, 0));

  docflow::lock::LockReaper reaper(store, options, std::chrono::milliseconds(10));
  assert(reaper.ReapOnce() == 1);
  assert(!store->Get("quotation:1", "DEFAULT").has_value());
  assert(store->Get("quotation:2", "DEFAULT").has_value());
  assert(store->Get("quotation:3", "OTHER").has_value());

  reaper.Start();
  reaper.Stop();
}

} // namespace

int main() {
  TestMutualExclusion();
  TestTimeoutRespectsBound();
  TestKeysAreIndependent();
  TestReleasedOnException();
  TestStaleLockIsTakenOver();
  TestReleaseAfterTakeoverIsNoop();
  TestHolderIdsAreUnique();
  TestReaperRemovesOnlyStaleRows();
  TestReleaseNeverThrows();
  TestProjectKeysAreSeparateFromQuotations();

  std::cout << "docflow_unit_lock_service: pass\n";
  return 0;
}
