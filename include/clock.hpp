#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace poolcore {

/**
 * Abstract time source for the clock service.
 * Allows injection of mock clocks for testing expiry logic.
 *
 * Usage in production:
 *   auto source = std::make_shared<SystemClock>();
 *
 * Usage in tests:
 *   auto mock = std::make_shared<MockClock>(1000);
 *   ClockService service(config, mock);
 *   mock->advance(5);
 *   service.tick();  // cached value is now 1005
 */
class Clock {
 public:
  virtual ~Clock() = default;

  /**
   * Get current time in milliseconds since Unix epoch.
   */
  virtual int64_t now_millis() const = 0;
};

/**
 * System clock using std::chrono (production).
 */
class SystemClock : public Clock {
 public:
  int64_t now_millis() const override;
};

/**
 * Mock clock for testing (controllable time).
 */
class MockClock : public Clock {
 public:
  explicit MockClock(int64_t initial_time = 0) : current_time_(initial_time) {}

  int64_t now_millis() const override {
    return current_time_.load(std::memory_order_relaxed);
  }

  void set_time(int64_t millis) {
    current_time_.store(millis, std::memory_order_relaxed);
  }

  /**
   * Advance time by delta milliseconds.
   */
  void advance(int64_t delta_millis) {
    current_time_.fetch_add(delta_millis, std::memory_order_relaxed);
  }

  void advance_seconds(int64_t seconds) { advance(seconds * 1000); }

 private:
  std::atomic<int64_t> current_time_;
};

}  // namespace poolcore

#endif  // CLOCK_HPP
