#include "time.hpp"

namespace trackmatch::util {

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
  return TimePoint{} + std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos());
}

google::protobuf::Duration ToProto(Milliseconds d) {
  auto sec   = std::chrono::duration_cast<std::chrono::seconds>(d);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(d - sec);

  google::protobuf::Duration out;
  out.set_seconds(sec.count());
  out.set_nanos(static_cast<int32_t>(nanos.count()));
  return out;
}

Milliseconds ToMillis(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<Milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

double ElapsedMs(SteadyClock::time_point since) {
  return std::chrono::duration<double, std::milli>(SteadyClock::now() - since).count();
}

} // namespace trackmatch::util
