#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace shopstack::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

} // namespace shopstack::util
