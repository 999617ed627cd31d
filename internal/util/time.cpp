#include "time.hpp"

namespace saga::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  if (d.seconds() == 0 && d.nanos() == 0) {
    return fallback;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

} // namespace saga::util
