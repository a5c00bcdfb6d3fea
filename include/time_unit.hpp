#ifndef TIME_UNIT_HPP
#define TIME_UNIT_HPP

#include <arrow/result.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace poolcore {

/**
 * Granularity of a TTL value stored in a PoolConfig.
 */
enum class TimeUnit {
  NANOSECONDS,
  MICROSECONDS,
  MILLISECONDS,
  SECONDS,
  MINUTES,
  HOURS,
  DAYS
};

/**
 * Convert a value in the given unit to milliseconds.
 * Sub-millisecond units truncate toward zero, larger units saturate at the
 * int64 range instead of overflowing.
 */
int64_t to_millis(int64_t value, TimeUnit unit);

std::string to_string(TimeUnit unit);

/**
 * Parse a unit name such as "seconds", "SECONDS" or "second".
 * Returns Status::Invalid for anything else.
 */
arrow::Result<TimeUnit> parse_time_unit(std::string_view name);

}  // namespace poolcore

#endif  // TIME_UNIT_HPP
