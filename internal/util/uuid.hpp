#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace relcache::util {

/*
  Random (version 4) UUIDs, used to name subscription cursors.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

// 8-4-4-4-12 lowercase hex
std::string ToString(const UUID& id);

// "sub_<uuid>", unique per attached subscription
std::string NewSubscriberId();

} // namespace relcache::util
