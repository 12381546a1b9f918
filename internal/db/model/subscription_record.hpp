#pragma once

#include <cstdint>
#include <string>

namespace relcache::db::model {

// last_message_id == -1 means nothing delivered yet
struct SubscriptionRecord {
  std::string  channel;
  std::string  subscriber;
  std::int64_t last_message_id = -1;
  std::int64_t created_at_ms   = 0;
  std::int64_t updated_at_ms   = 0;
};

} // namespace relcache::db::model
