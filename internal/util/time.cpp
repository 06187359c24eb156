#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace handoff::util {

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

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

void SetTimestamp(uint64_t ms, google::protobuf::Timestamp* out) {
  if (ms == 0) {
    return;
  }
  *out = ToProto(FromUnixMillis(ms));
}

std::string FormatRfc3339(uint64_t ms) {
  if (ms == 0) {
    return {};
  }
  return google::protobuf::util::TimeUtil::ToString(ToProto(FromUnixMillis(ms)));
}

} // namespace handoff::util
