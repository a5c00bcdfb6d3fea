#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string_view>

namespace poolcore {

bool parse_bool_flag(const std::string& value) {
  std::string lower(value);
  std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

arrow::Result<ClockConfig> ClockConfig::from_environment() {
  auto builder = make_clock_config();

  if (const char* precise = std::getenv(env::CLOCK_PRECISE)) {
    builder.with_precise(parse_bool_flag(precise));
  }

  if (const char* tick = std::getenv(env::CLOCK_TICK_MICROS)) {
    std::string_view text(tick);
    int64_t micros = 0;
    auto [ptr, ec] =
        std::from_chars(text.data(), text.data() + text.size(), micros);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
      return arrow::Status::Invalid(env::CLOCK_TICK_MICROS,
                                    " is not an integer: '", text, "'");
    }
    if (micros <= 0) {
      return arrow::Status::Invalid(env::CLOCK_TICK_MICROS,
                                    " must be positive but was ", micros);
    }
    builder.with_tick_interval(std::chrono::microseconds(micros));
  }

  return builder.build();
}

}  // namespace poolcore
