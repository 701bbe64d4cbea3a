#include "time.hpp"

namespace slideshow::util {

TimePoint Now() {
  return Clock::now();
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) +
                                                                   std::chrono::nanoseconds(ts.nanos()));
}

} // namespace slideshow::util
