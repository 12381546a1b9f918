#include "counter.hpp"

#include <charconv>
#include <limits>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relcache::cache {

std::optional<std::int64_t> ParseInt64(const std::string& value) {
  std::int64_t out   = 0;
  const char*  begin = value.data();
  const char*  end   = value.data() + value.size();

  auto [ptr, ec] = std::from_chars(begin, end, out);
  if (ec != std::errc() || ptr != end || value.empty()) return std::nullopt;
  return out;
}

std::int64_t IncrBy(Client& client, const std::string& key, std::int64_t delta, int max_attempts) {
  if (max_attempts < 1) max_attempts = 1;

  for (int attempt = 1;; ++attempt) {
    std::int64_t result = 0;
    try {
      client.Transaction([&](Context& ctx) {
        ctx.LockKey(key);

        std::int64_t current = 0;
        try {
          auto raw    = ctx.Get().GetString(key);
          auto parsed = ParseInt64(raw);
          if (!parsed) throw util::ValidationError("incrby: value is not an integer: " + key);
          current = *parsed;
        } catch (const util::NotFound&) {
          current = 0;
        }

        if ((delta > 0 && current > std::numeric_limits<std::int64_t>::max() - delta) ||
            (delta < 0 && current < std::numeric_limits<std::int64_t>::min() - delta)) {
          throw util::ValidationError("incrby: increment would overflow: " + key);
        }
        result = current + delta;

        ctx.Get().Set(key, std::to_string(result), kKeepTtl);
      });
      return result;
    } catch (const util::StoreError& e) {
      if (!e.Retryable() || attempt >= max_attempts) throw;

      RELCACHE_LOG_WARN("counter transaction retry", {observability::StringField("key", key),
                                                      observability::IntField("attempt", attempt),
                                                      observability::StringField("error", e.what())});
      std::this_thread::sleep_for(std::chrono::milliseconds(attempt * 5));
    }
  }
}

} // namespace relcache::cache
