#include "clock.hpp"

namespace poolcore {

int64_t SystemClock::now_millis() const {
  auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             now.time_since_epoch())
      .count();
}

}  // namespace poolcore
