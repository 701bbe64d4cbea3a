#pragma once

#include <chrono>

#include "google/protobuf/timestamp.pb.h"

namespace slideshow::util {

/*
  Time utilities. All clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

TimePoint FromProto(const google::protobuf::Timestamp& ts);

} // namespace slideshow::util
