#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace fleet::util {

/*
  Time utilities; the one place the clock source is chosen.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = std::chrono::milliseconds;

TimePoint Now();

Duration                   FromProto(const google::protobuf::Duration& d);
google::protobuf::Duration ToProto(Duration d);

// Returns fallback when the field is unset or zero.
Duration FromProtoOr(const google::protobuf::Duration& d, Duration fallback);

int64_t ToUnixSeconds(TimePoint tp);

} // namespace fleet::util
