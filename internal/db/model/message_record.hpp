#pragma once

#include <cstdint>
#include <string>

namespace relcache::db::model {

struct MessageRecord {
  std::int64_t id = 0; // assigned by the store on append
  std::string  channel;
  std::string  payload;
  std::int64_t created_at_ms = 0;
};

} // namespace relcache::db::model
