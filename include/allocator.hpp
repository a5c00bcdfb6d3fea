#ifndef ALLOCATOR_HPP
#define ALLOCATOR_HPP

#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>

namespace poolcore {

/**
 * Capability a pool uses to create and destroy its elements.
 * poolcore only carries it around in PoolConfig; the pool decides when to
 * call it.
 */
template <typename T>
class Allocator {
 public:
  using element_type = T;

  virtual ~Allocator() = default;

  virtual arrow::Result<std::shared_ptr<T>> allocate() = 0;

  virtual arrow::Status deallocate(std::shared_ptr<T> element) = 0;
};

}  // namespace poolcore

#endif  // ALLOCATOR_HPP
