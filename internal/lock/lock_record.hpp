#pragma once

#include <cstdint>
#include <string>

namespace docflow::lock {

/*
  One held lock.

  Unique on (lock_key, region). A row whose created_at_ms is older than the
  configured TTL is stale: any acquirer may overwrite it.
*/
struct LockRecord {
  std::string   lock_key;   // "<entity>:<id>", e.g. "quotation:42"
  std::string   region;     // namespace shared by all locks of one deployment
  std::string   holder_id;  // unique per acquisition
  std::uint64_t created_at_ms = 0;
};

} // namespace docflow::lock
