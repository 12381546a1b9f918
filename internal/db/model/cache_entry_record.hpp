#pragma once

#include <cstdint>
#include <string>

namespace relcache::db::model {

// Expiry sentinel for entries that never expire: 9999-12-31T23:59:59.999Z.
inline constexpr std::int64_t kNeverExpireMs = 253402300799999;

struct CacheEntryRecord {
  std::int64_t id = 0;
  std::string  key;
  std::string  value; // raw bytes
  std::int64_t expire_at_ms  = kNeverExpireMs;
  std::int64_t created_at_ms = 0;
  std::int64_t updated_at_ms = 0;

  bool IsLive(std::int64_t now_ms) const {
    return expire_at_ms > now_ms;
  }
};

} // namespace relcache::db::model
