#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/lock/lock_store.hpp"

namespace docflow::lock {

/*
  Process-local lock table.

  Coordinates threads of one process only; used by tests and when no
  database is configured.
*/
class MemoryLockStore final : public LockStore {
 public:
  db::Result TryInsert(const LockRecord& record, std::uint64_t stale_before_ms) override;
  db::Result Delete(const std::string& lock_key, const std::string& region, const std::string& holder_id) override;
  std::optional<LockRecord> Get(const std::string& lock_key, const std::string& region) override;
  db::Result ReapExpired(const std::string& region, std::uint64_t stale_before_ms, std::uint64_t* reaped) override;

  std::size_t Size() const;

 private:
  static std::string Key(const std::string& lock_key, const std::string& region);
  static bool        IsStale(const LockRecord& record, std::uint64_t stale_before_ms);

  mutable std::mutex                          mutex_;
  std::unordered_map<std::string, LockRecord> locks_;
};

} // namespace docflow::lock
