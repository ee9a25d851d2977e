#include "ulidtool/core/clock.h"

#include "ulidtool/core/errors.h"

#include <chrono>
#include <string>

namespace ulidtool::core {

std::uint64_t checked_timestamp(const std::int64_t ms) {
  if (ms < 0 || static_cast<std::uint64_t>(ms) > kMaxTimestampMs) {
    throw FatalInitializationError("timestamp " + std::to_string(ms) +
                                   " ms does not fit in the 48-bit timestamp field");
  }
  return static_cast<std::uint64_t>(ms);
}

std::uint64_t SystemClock::now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return checked_timestamp(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::uint64_t FixedClock::now_ms() {
  return fixed_ms_;
}

}  // namespace ulidtool::core
