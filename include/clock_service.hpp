#ifndef CLOCK_SERVICE_HPP
#define CLOCK_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "clock.hpp"
#include "config.hpp"
#include "logger.hpp"

namespace poolcore {

/**
 * Shared "current time" source for TTL checks.
 *
 * Precise mode reads the underlying Clock on every call. Approximate mode
 * returns a cached value refreshed by a background ticker roughly once per
 * tick interval, so a read is a single relaxed atomic load and may lag real
 * time by up to one interval.
 *
 * The ticker is created on the first start() and lives until the service is
 * destroyed. stop() only pauses it.
 *
 * Usage:
 *   auto clock = ClockService::shared();
 *   clock->start();
 *   int64_t now = clock->current_time_millis();
 *
 * Usage in tests:
 *   auto source = std::make_shared<MockClock>(1000);
 *   ClockService clock(make_clock_config().build(), source);
 *   clock.tick();                      // 1000
 *   clock.advance_by_smallest_unit();  // 1001
 */
class ClockService {
 public:
  enum class State { STOPPED, RUNNING, PAUSED };

  explicit ClockService(const ClockConfig& config,
                        std::shared_ptr<Clock> source =
                            std::make_shared<SystemClock>());

  ~ClockService();

  ClockService(const ClockService&) = delete;
  ClockService& operator=(const ClockService&) = delete;

  /**
   * Process-wide instance, created on first use from
   * ClockConfig::from_environment(). Falls back to the default config when
   * the environment is invalid.
   */
  static std::shared_ptr<ClockService> shared();

  int64_t current_time_millis() const {
    if (precise_) {
      return source_->now_millis();
    }
    return cached_millis_.load(std::memory_order_relaxed);
  }

  /**
   * Refresh the cached time from the source.
   * @return the new cached value
   */
  int64_t tick();

  /**
   * Move the cached time forward by exactly one millisecond.
   * Only valid while the ticker is not running, from a single thread.
   */
  int64_t advance_by_smallest_unit();

  /**
   * Tick once, then launch or resume the ticker. No-op while running.
   */
  void start();

  /**
   * Ask the ticker to pause. Returns without waiting for it.
   */
  void stop();

  State state() const { return state_.load(std::memory_order_acquire); }
  bool is_precise() const { return precise_; }
  std::chrono::microseconds tick_interval() const { return tick_interval_; }

  // id of the ticker thread, default-constructed before the first start()
  std::thread::id ticker_id() const;

 private:
  void run_ticker();

  const bool precise_;
  const std::chrono::microseconds tick_interval_;
  const std::shared_ptr<Clock> source_;

  std::atomic<int64_t> cached_millis_{0};
  std::atomic<State> state_{State::STOPPED};
  std::atomic<bool> shutdown_{false};

  mutable std::mutex mutex_;
  std::condition_variable resumed_;
  std::thread ticker_;

  ContextLogger logger_{"ClockService"};
};

const char* to_string(ClockService::State state);

}  // namespace poolcore

#endif  // CLOCK_SERVICE_HPP
