#include "time.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace feedstore::util {

namespace {

constexpr int64_t kNanosPerSecond = 1'000'000'000;

// Extremes of an int64 nanosecond count, split into floored seconds + nanos.
constexpr int64_t kMaxSeconds    = std::numeric_limits<int64_t>::max() / kNanosPerSecond;
constexpr int64_t kMaxNanosAtMax = std::numeric_limits<int64_t>::max() % kNanosPerSecond;
constexpr int64_t kMinSeconds    = std::numeric_limits<int64_t>::min() / kNanosPerSecond - 1;
constexpr int64_t kMinNanosAtMin = kNanosPerSecond + std::numeric_limits<int64_t>::min() % kNanosPerSecond;

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  // floor so that nanos is always in [0, 1e9) for pre-epoch instants
  const int64_t total = ToUnixNanos(tp);
  int64_t       sec   = total / kNanosPerSecond;
  int64_t       nanos = total % kNanosPerSecond;
  if (nanos < 0) {
    sec -= 1;
    nanos += kNanosPerSecond;
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec);
  ts.set_nanos(static_cast<int32_t>(nanos));
  return ts;
}

bool IsRepresentable(const google::protobuf::Timestamp& ts) {
  const int64_t sec   = ts.seconds();
  const int64_t nanos = ts.nanos();

  if (nanos < 0 || nanos >= kNanosPerSecond) return false;
  if (sec > kMaxSeconds || sec < kMinSeconds) return false;
  if (sec == kMaxSeconds && nanos > kMaxNanosAtMax) return false;
  if (sec == kMinSeconds && nanos < kMinNanosAtMin) return false;
  return true;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  if (!IsRepresentable(ts)) {
    throw std::out_of_range("timestamp " + std::to_string(ts.seconds()) + "s " + std::to_string(ts.nanos()) + "ns is not representable");
  }

  // (sec + 1) keeps sec * 1e9 inside int64 at the negative extreme
  const int64_t total = ts.seconds() < 0 ? (ts.seconds() + 1) * kNanosPerSecond - (kNanosPerSecond - ts.nanos())
                                         : ts.seconds() * kNanosPerSecond + ts.nanos();
  return FromUnixNanos(total);
}

int64_t ToUnixNanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixNanos(int64_t nanos) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(nanos));
}

} // namespace feedstore::util
