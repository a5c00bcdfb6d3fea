#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <arrow/result.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace poolcore {

// Default configuration constants
namespace defaults {
constexpr bool CLOCK_PRECISE = false;
constexpr int64_t CLOCK_TICK_MICROS = 1000;  // 1 ms
constexpr int POOL_SIZE = 10;
constexpr int64_t POOL_TTL = 10;  // in POOL_TTL_UNIT
}  // namespace defaults

// Environment variables read by ClockConfig::from_environment()
namespace env {
constexpr const char* CLOCK_PRECISE = "POOLCORE_CLOCK_PRECISE";
constexpr const char* CLOCK_TICK_MICROS = "POOLCORE_CLOCK_TICK_MICROS";
constexpr const char* LOG_LEVEL = "POOLCORE_LOG_LEVEL";
}  // namespace env

// Configuration parameters for the clock service.
// Fixed once a ClockService has been constructed from it.
class ClockConfig {
 private:
  // Read the time source on every call instead of the cached tick
  bool precise = defaults::CLOCK_PRECISE;

  // Sleep between two ticks of the background ticker
  std::chrono::microseconds tick_interval{defaults::CLOCK_TICK_MICROS};

  // Allow ClockConfigBuilder to modify private fields
  friend class ClockConfigBuilder;

 public:
  bool is_precise() const { return precise; }
  std::chrono::microseconds get_tick_interval() const { return tick_interval; }

  /**
   * Build a config from POOLCORE_CLOCK_PRECISE and
   * POOLCORE_CLOCK_TICK_MICROS. Unset variables keep their defaults.
   */
  static arrow::Result<ClockConfig> from_environment();
};

// Builder class for ClockConfig
class ClockConfigBuilder {
 private:
  ClockConfig config;

 public:
  ClockConfigBuilder() = default;

  ClockConfigBuilder &with_precise(bool precise) {
    config.precise = precise;
    return *this;
  }

  ClockConfigBuilder &with_tick_interval(std::chrono::microseconds interval) {
    config.tick_interval = interval;
    return *this;
  }

  [[nodiscard]] ClockConfig build() const { return config; }
};

// Helper function to create a config builder
inline ClockConfigBuilder make_clock_config() { return {}; }

// "true", "1", "yes", "on" (any case) are true; everything else is false.
bool parse_bool_flag(const std::string &value);

}  // namespace poolcore

#endif  // CONFIG_HPP
