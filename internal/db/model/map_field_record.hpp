#pragma once

#include <cstdint>
#include <string>

namespace relcache::db::model {

struct MapFieldRecord {
  std::string  key;
  std::string  field;
  std::string  value;
  std::int64_t created_at_ms = 0;
  std::int64_t updated_at_ms = 0;
};

} // namespace relcache::db::model
