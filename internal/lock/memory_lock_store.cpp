#include "internal/lock/memory_lock_store.hpp"

namespace docflow::lock {

std::string MemoryLockStore::Key(const std::string& lock_key, const std::string& region) {
  return region + '\n' + lock_key;
}

bool MemoryLockStore::IsStale(const LockRecord& record, std::uint64_t stale_before_ms) {
  return record.created_at_ms < stale_before_ms;
}

db::Result MemoryLockStore::TryInsert(const LockRecord& record, std::uint64_t stale_before_ms) {
  std::lock_guard lock(mutex_);

  auto [it, inserted] = locks_.try_emplace(Key(record.lock_key, record.region), record);
  if (inserted) {
    return db::Result::Ok();
  }
  if (!IsStale(it->second, stale_before_ms)) {
    return db::Result::Err(db::ErrorCode::Conflict, "held by " + it->second.holder_id);
  }

  it->second = record;
  return db::Result::Ok();
}

db::Result MemoryLockStore::Delete(const std::string& lock_key, const std::string& region, const std::string& holder_id) {
  std::lock_guard lock(mutex_);

  auto it = locks_.find(Key(lock_key, region));
  if (it != locks_.end() && it->second.holder_id == holder_id) {
    locks_.erase(it);
  }
  return db::Result::Ok();
}

std::optional<LockRecord> MemoryLockStore::Get(const std::string& lock_key, const std::string& region) {
  std::lock_guard lock(mutex_);

  auto it = locks_.find(Key(lock_key, region));
  if (it == locks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

db::Result MemoryLockStore::ReapExpired(const std::string& region, std::uint64_t stale_before_ms, std::uint64_t* reaped) {
  std::lock_guard lock(mutex_);

  std::uint64_t count = 0;
  for (auto it = locks_.begin(); it != locks_.end();) {
    if (it->second.region == region && IsStale(it->second, stale_before_ms)) {
      it = locks_.erase(it);
      ++count;
      continue;
    }
    ++it;
  }

  if (reaped) *reaped = count;
  return db::Result::Ok();
}

std::size_t MemoryLockStore::Size() const {
  std::lock_guard lock(mutex_);
  return locks_.size();
}

} // namespace docflow::lock
