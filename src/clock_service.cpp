#include "clock_service.hpp"

#include <utility>

namespace poolcore {

ClockService::ClockService(const ClockConfig& config,
                           std::shared_ptr<Clock> source)
    : precise_(config.is_precise()),
      tick_interval_(config.get_tick_interval()),
      source_(std::move(source)) {
  cached_millis_.store(source_->now_millis(), std::memory_order_relaxed);
}

ClockService::~ClockService() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_.store(true, std::memory_order_release);
  }
  resumed_.notify_all();
  if (ticker_.joinable()) {
    ticker_.join();
    logger_.debug("ticker shut down");
  }
}

std::shared_ptr<ClockService> ClockService::shared() {
  static const std::shared_ptr<ClockService> instance = [] {
    // constructed first so spdlog outlives the instance at exit
    Logger::getInstance();
    auto config_result = ClockConfig::from_environment();
    if (!config_result.ok()) {
      log_warn("Ignoring clock environment: {}",
               config_result.status().ToString());
      return std::make_shared<ClockService>(make_clock_config().build());
    }
    return std::make_shared<ClockService>(config_result.ValueOrDie());
  }();
  return instance;
}

int64_t ClockService::tick() {
  const int64_t now = source_->now_millis();
  cached_millis_.store(now, std::memory_order_relaxed);
  return now;
}

int64_t ClockService::advance_by_smallest_unit() {
  // single writer by contract; load + store instead of a locked RMW
  const int64_t next = cached_millis_.load(std::memory_order_relaxed) + 1;
  cached_millis_.store(next, std::memory_order_relaxed);
  return next;
}

void ClockService::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  const State current = state_.load(std::memory_order_acquire);
  if (current == State::RUNNING) {
    // the ticker is the only writer while running
    return;
  }
  tick();

  switch (current) {
    case State::RUNNING:
      return;
    case State::STOPPED:
      // a throwing std::thread leaves the service STOPPED
      ticker_ = std::thread(&ClockService::run_ticker, this);
      state_.store(State::RUNNING, std::memory_order_release);
      logger_.debug("ticker launched (precise={}, interval={}us)", precise_,
                    tick_interval_.count());
      return;
    case State::PAUSED:
      state_.store(State::RUNNING, std::memory_order_release);
      resumed_.notify_all();
      logger_.debug("ticker resumed");
      return;
  }
}

void ClockService::stop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.load(std::memory_order_acquire) == State::RUNNING) {
    state_.store(State::PAUSED, std::memory_order_release);
    logger_.debug("ticker pause requested");
  }
}

std::thread::id ClockService::ticker_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ticker_.get_id();
}

void ClockService::run_ticker() {
  while (!shutdown_.load(std::memory_order_acquire)) {
    if (state_.load(std::memory_order_acquire) == State::PAUSED) {
      std::unique_lock<std::mutex> lock(mutex_);
      resumed_.wait(lock, [this] {
        return shutdown_.load(std::memory_order_acquire) ||
               state_.load(std::memory_order_acquire) != State::PAUSED;
      });
      continue;
    }
    tick();
    std::this_thread::sleep_for(tick_interval_);
  }
}

const char* to_string(const ClockService::State state) {
  switch (state) {
    case ClockService::State::STOPPED:
      return "STOPPED";
    case ClockService::State::RUNNING:
      return "RUNNING";
    case ClockService::State::PAUSED:
      return "PAUSED";
  }
  return "UNKNOWN";
}

}  // namespace poolcore
