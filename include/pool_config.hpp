#ifndef POOL_CONFIG_HPP
#define POOL_CONFIG_HPP

#include <arrow/result.h>
#include <arrow/status.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "allocator.hpp"
#include "config.hpp"
#include "time_unit.hpp"

namespace poolcore {

namespace defaults {
constexpr TimeUnit POOL_TTL_UNIT = TimeUnit::MINUTES;
}  // namespace defaults

/**
 * Whether PoolConfig setters enforce their constraints.
 * RELAXED accepts a size below 1 and a missing TTL unit; it exists for
 * internal and test scenarios and is never the default.
 */
enum class ValidationPolicy { STRICT, RELAXED };

/**
 * Construction parameters for a pool of T.
 *
 * Every accessor and mutator holds the instance mutex, so a config can be
 * shared between threads. Under STRICT validation a failed setter returns
 * Status::Invalid and leaves the previous value in place.
 */
template <typename T>
class PoolConfig {
 public:
  using element_type = T;

  explicit PoolConfig(ValidationPolicy policy = ValidationPolicy::STRICT)
      : policy_(policy) {}

  PoolConfig(const PoolConfig& other) { other.propagate_to(*this); }

  PoolConfig& operator=(const PoolConfig& other) {
    other.propagate_to(*this);
    return *this;
  }

  arrow::Status set_size(int size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (policy_ == ValidationPolicy::STRICT && size < 1) {
      return arrow::Status::Invalid("size must be at least 1 but was ", size);
    }
    size_ = size;
    return arrow::Status::OK();
  }

  int get_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
  }

  // The value is stored verbatim; only the unit is checked.
  arrow::Status set_ttl(int64_t ttl, std::optional<TimeUnit> unit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (policy_ == ValidationPolicy::STRICT && !unit.has_value()) {
      return arrow::Status::Invalid("ttl unit cannot be null");
    }
    ttl_ = ttl;
    ttl_unit_ = unit;
    return arrow::Status::OK();
  }

  int64_t get_ttl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ttl_;
  }

  std::optional<TimeUnit> get_ttl_unit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ttl_unit_;
  }

  /**
   * TTL converted to milliseconds, for comparing against
   * ClockService::current_time_millis().
   */
  arrow::Result<int64_t> ttl_millis() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ttl_unit_.has_value()) {
      return arrow::Status::Invalid("ttl unit is not set");
    }
    return to_millis(ttl_, *ttl_unit_);
  }

  void set_allocator(std::shared_ptr<Allocator<T>> allocator) {
    std::lock_guard<std::mutex> lock(mutex_);
    allocator_ = std::move(allocator);
  }

  std::shared_ptr<Allocator<T>> get_allocator() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allocator_;
  }

  /**
   * Config for a different element type: same size, TTL and policy,
   * with the given allocator.
   */
  template <typename U>
  PoolConfig<U> rebind(std::shared_ptr<Allocator<U>> allocator) const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolConfig<U> result(policy_);
    result.assign(size_, ttl_, ttl_unit_, std::move(allocator), policy_);
    return result;
  }

  // Internal and test use: stop enforcing constraints on this instance.
  void relax_validation() {
    std::lock_guard<std::mutex> lock(mutex_);
    policy_ = ValidationPolicy::RELAXED;
  }

  ValidationPolicy get_validation_policy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_;
  }

  /**
   * Check the STRICT constraints whatever the policy. A pool should call
   * this before trusting a RELAXED config.
   */
  arrow::Status validate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (size_ < 1) {
      return arrow::Status::Invalid("size must be at least 1 but was ", size_);
    }
    if (!ttl_unit_.has_value()) {
      return arrow::Status::Invalid("ttl unit cannot be null");
    }
    return arrow::Status::OK();
  }

  /**
   * Copy size, TTL, allocator and validation policy onto `other` while
   * holding both locks. `other` stays independent afterwards.
   */
  void propagate_to(PoolConfig& other) const {
    if (&other == this) {
      return;
    }
    std::scoped_lock lock(mutex_, other.mutex_);
    other.size_ = size_;
    other.ttl_ = ttl_;
    other.ttl_unit_ = ttl_unit_;
    other.allocator_ = allocator_;
    other.policy_ = policy_;
  }

 private:
  template <typename>
  friend class PoolConfig;

  void assign(int size, int64_t ttl, std::optional<TimeUnit> unit,
              std::shared_ptr<Allocator<T>> allocator,
              ValidationPolicy policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_ = size;
    ttl_ = ttl;
    ttl_unit_ = unit;
    allocator_ = std::move(allocator);
    policy_ = policy;
  }

  mutable std::mutex mutex_;
  int size_ = defaults::POOL_SIZE;
  int64_t ttl_ = defaults::POOL_TTL;
  std::optional<TimeUnit> ttl_unit_ = defaults::POOL_TTL_UNIT;
  std::shared_ptr<Allocator<T>> allocator_;
  ValidationPolicy policy_ = ValidationPolicy::STRICT;
};

}  // namespace poolcore

#endif  // POOL_CONFIG_HPP
