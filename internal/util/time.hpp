#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace handoff::util {

/*
  Clock access and unix-millisecond conversions.

  Persistent records carry unix milliseconds, 0 meaning "unset".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable clock; components default to Now() and tests pin it.
using NowFn = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Millisecond timestamp to proto, leaving the field cleared for 0.
void SetTimestamp(uint64_t ms, google::protobuf::Timestamp* out);

// RFC 3339 text, empty for 0.
std::string FormatRfc3339(uint64_t ms);

} // namespace handoff::util
