#include "time.hpp"

#include <string>

#include "errors.hpp"

namespace progress::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
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

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms) {
  return ToProto(FromUnixMillis(unix_ms));
}

uint64_t ProtoToMillis(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() < 0) {
    throw InvalidArgument("timestamp precedes the unix epoch (seconds=" + std::to_string(ts.seconds()) + ")");
  }
  if (ts.nanos() < 0 || ts.nanos() > 999'999'999) {
    throw InvalidArgument("timestamp nanos out of range (" + std::to_string(ts.nanos()) + ")");
  }
  return ToUnixMillis(FromProto(ts));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t unix_ms) {
  return TimePoint{} + std::chrono::milliseconds(unix_ms);
}

} // namespace progress::util
