#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace relcache::util {

/*
  Time utilities. Single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixMillis(TimePoint tp);

// Epoch milliseconds of Now()
std::int64_t NowMs();

// Unset or negative durations map to fallback.
std::chrono::milliseconds FromProto(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

google::protobuf::Duration ToProto(std::chrono::milliseconds d);

} // namespace relcache::util
