#include "time.hpp"

namespace loyalty::util {

TimePoint Now() {
  return Clock::now();
}

std::int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(std::int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

std::int64_t DurationMillis(std::chrono::milliseconds d) {
  return d.count();
}

} // namespace loyalty::util
