#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/cache/client.hpp"

namespace relcache::cache {

inline constexpr int kDefaultCounterAttempts = 5;

/*
  Atomic increment on a decimal string value.

  Lock key, read (missing = 0), add, write back with kKeepTtl, all
  in one transaction. Busy/serialization failures retry the whole
  transaction up to max_attempts times.

  Throws util::ValidationError when the stored value is not a
  base-10 int64 or the sum overflows.
*/
std::int64_t IncrBy(Client& client, const std::string& key, std::int64_t delta,
                    int max_attempts = kDefaultCounterAttempts);

inline std::int64_t Incr(Client& client, const std::string& key, int max_attempts = kDefaultCounterAttempts) {
  return IncrBy(client, key, 1, max_attempts);
}

// Strict base-10 int64 parse. nullopt on junk or out of range.
std::optional<std::int64_t> ParseInt64(const std::string& value);

} // namespace relcache::cache
