#include "time.hpp"

namespace rentledger::util {

TimePoint Now() {
  return Clock::now();
}

TimePoint FromUnixSeconds(std::uint64_t seconds) {
  return TimePoint{} + std::chrono::seconds(seconds);
}

std::uint64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace rentledger::util
