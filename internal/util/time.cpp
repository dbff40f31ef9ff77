#include "time.hpp"

namespace shopstack::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(unix_ms / 1000));
  ts.set_nanos(static_cast<int32_t>((unix_ms % 1000) * 1000000));
  return ts;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

} // namespace shopstack::util
