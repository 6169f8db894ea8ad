#include "time.hpp"

namespace komorebi::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int64_t NowUnixMillis() {
  return ToUnixMillis(Now());
}

} // namespace komorebi::util
