#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace feedstore::util {

/*
  Time utilities. All store timestamps come from Now().

  Cache timestamps are system_clock instants and must survive every backend
  without losing resolution.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

// True when ts fits an int64 nanosecond count (roughly years 1677 to 2262).
bool IsRepresentable(const google::protobuf::Timestamp& ts);

// Throws std::out_of_range when !IsRepresentable(ts).
TimePoint FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixNanos(TimePoint tp);
TimePoint FromUnixNanos(int64_t nanos);

} // namespace feedstore::util
