#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/lock/lock_record.hpp"

namespace docflow::lock {

/*
  Durable keyed-mutex storage.

  Implementations must make TryInsert a single atomic step: either the
  caller's row is now the one stored for (lock_key, region), or the call
  reports Conflict and nothing changed. Rows created strictly before
  stale_before_ms are treated as abandoned and overwritten.

  Every method reports backend trouble through db::Result; Busy means
  "try again", anything else is a real failure.
*/
class LockStore {
 public:
  virtual ~LockStore() = default;

  // Ok: claimed. Conflict: a live row belongs to someone else.
  virtual db::Result TryInsert(const LockRecord& record, std::uint64_t stale_before_ms) = 0;

  // Deletes the row only while it still belongs to holder_id. Deleting a
  // row that is gone or re-claimed is Ok.
  virtual db::Result Delete(const std::string& lock_key, const std::string& region, const std::string& holder_id) = 0;

  virtual std::optional<LockRecord> Get(const std::string& lock_key, const std::string& region) = 0;

  // Removes every row of `region` created before stale_before_ms.
  virtual db::Result ReapExpired(const std::string& region, std::uint64_t stale_before_ms, std::uint64_t* reaped) = 0;
};

} // namespace docflow::lock
