#include "time_unit.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <utility>

namespace poolcore {

namespace {

int64_t saturating_multiply(int64_t value, int64_t factor) {
  constexpr int64_t max = std::numeric_limits<int64_t>::max();
  constexpr int64_t min = std::numeric_limits<int64_t>::min();
  if (value > max / factor) return max;
  if (value < min / factor) return min;
  return value * factor;
}

constexpr std::array<std::pair<std::string_view, TimeUnit>, 7> kUnitNames = {{
    {"nanoseconds", TimeUnit::NANOSECONDS},
    {"microseconds", TimeUnit::MICROSECONDS},
    {"milliseconds", TimeUnit::MILLISECONDS},
    {"seconds", TimeUnit::SECONDS},
    {"minutes", TimeUnit::MINUTES},
    {"hours", TimeUnit::HOURS},
    {"days", TimeUnit::DAYS},
}};

}  // namespace

int64_t to_millis(const int64_t value, const TimeUnit unit) {
  switch (unit) {
    case TimeUnit::NANOSECONDS:
      return value / 1'000'000;
    case TimeUnit::MICROSECONDS:
      return value / 1'000;
    case TimeUnit::MILLISECONDS:
      return value;
    case TimeUnit::SECONDS:
      return saturating_multiply(value, 1'000);
    case TimeUnit::MINUTES:
      return saturating_multiply(value, 60'000);
    case TimeUnit::HOURS:
      return saturating_multiply(value, 3'600'000);
    case TimeUnit::DAYS:
      return saturating_multiply(value, 86'400'000);
  }
  return value;
}

std::string to_string(const TimeUnit unit) {
  for (const auto& [name, candidate] : kUnitNames) {
    if (candidate == unit) {
      std::string upper(name);
      std::ranges::transform(upper, upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
      });
      return upper;
    }
  }
  return "UNKNOWN";
}

arrow::Result<TimeUnit> parse_time_unit(std::string_view name) {
  std::string lower(name);
  std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  for (const auto& [unit_name, unit] : kUnitNames) {
    // accept the singular form as well ("second")
    if (lower == unit_name ||
        lower == unit_name.substr(0, unit_name.size() - 1)) {
      return unit;
    }
  }
  return arrow::Status::Invalid("Unknown time unit: '", name, "'");
}

}  // namespace poolcore
