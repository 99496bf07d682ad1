#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace trackmatch::util {

/*
  Time utilities.

  Wall clock for reporting, steady clock for deadlines.
*/

using Clock         = std::chrono::system_clock;
using TimePoint     = Clock::time_point;
using SteadyClock   = std::chrono::steady_clock;
using Milliseconds  = std::chrono::milliseconds;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

google::protobuf::Duration ToProto(Milliseconds d);
Milliseconds               ToMillis(const google::protobuf::Duration& d);

uint64_t ToUnixMillis(TimePoint tp);

double ElapsedMs(SteadyClock::time_point since);

} // namespace trackmatch::util
