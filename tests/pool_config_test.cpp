#include "../include/pool_config.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace poolcore {

struct Connection {
  int id;
};

struct Session {
  std::string user;
};

template <typename T>
class CountingAllocator : public Allocator<T> {
 public:
  arrow::Result<std::shared_ptr<T>> allocate() override {
    allocated_.fetch_add(1);
    return std::make_shared<T>();
  }

  arrow::Status deallocate(std::shared_ptr<T> element) override {
    if (!element) {
      return arrow::Status::Invalid("cannot deallocate a null element");
    }
    deallocated_.fetch_add(1);
    return arrow::Status::OK();
  }

  int allocated() const { return allocated_.load(); }
  int deallocated() const { return deallocated_.load(); }

 private:
  std::atomic<int> allocated_{0};
  std::atomic<int> deallocated_{0};
};

class PoolConfigTest : public ::testing::Test {
 protected:
  PoolConfig<Connection> config_;
  std::shared_ptr<CountingAllocator<Connection>> allocator_ =
      std::make_shared<CountingAllocator<Connection>>();
};

TEST_F(PoolConfigTest, Defaults) {
  EXPECT_EQ(config_.get_size(), 10);
  EXPECT_EQ(config_.get_ttl(), 10);
  EXPECT_EQ(config_.get_ttl_unit(), TimeUnit::MINUTES);
  EXPECT_EQ(config_.get_allocator(), nullptr);
  EXPECT_EQ(config_.get_validation_policy(), ValidationPolicy::STRICT);
  EXPECT_TRUE(config_.validate().ok());
}

TEST_F(PoolConfigTest, SetSizeAcceptsPositiveValues) {
  for (int n : {1, 2, 10, 1000}) {
    ASSERT_TRUE(config_.set_size(n).ok());
    EXPECT_EQ(config_.get_size(), n);
  }
}

TEST_F(PoolConfigTest, StrictRejectsSizeBelowOne) {
  ASSERT_TRUE(config_.set_size(7).ok());

  for (int n : {0, -1, -100}) {
    auto status = config_.set_size(n);
    EXPECT_TRUE(status.IsInvalid()) << status.ToString();
    EXPECT_EQ(config_.get_size(), 7);
  }
}

TEST_F(PoolConfigTest, RelaxedAcceptsSizeBelowOne) {
  config_.relax_validation();
  EXPECT_EQ(config_.get_validation_policy(), ValidationPolicy::RELAXED);

  ASSERT_TRUE(config_.set_size(0).ok());
  EXPECT_EQ(config_.get_size(), 0);
  ASSERT_TRUE(config_.set_size(-3).ok());
  EXPECT_EQ(config_.get_size(), -3);

  // validate() still applies the strict rules
  EXPECT_TRUE(config_.validate().IsInvalid());
}

TEST_F(PoolConfigTest, RelaxedPolicyAtConstruction) {
  PoolConfig<Connection> relaxed(ValidationPolicy::RELAXED);
  ASSERT_TRUE(relaxed.set_size(0).ok());
  EXPECT_EQ(relaxed.get_size(), 0);
}

TEST_F(PoolConfigTest, SetTtlStoresPairVerbatim) {
  ASSERT_TRUE(config_.set_ttl(30, TimeUnit::SECONDS).ok());
  EXPECT_EQ(config_.get_ttl(), 30);
  EXPECT_EQ(config_.get_ttl_unit(), TimeUnit::SECONDS);

  // no bounds checking on the value
  ASSERT_TRUE(config_.set_ttl(-5, TimeUnit::DAYS).ok());
  EXPECT_EQ(config_.get_ttl(), -5);
  EXPECT_EQ(config_.get_ttl_unit(), TimeUnit::DAYS);
}

TEST_F(PoolConfigTest, StrictRejectsMissingTtlUnit) {
  ASSERT_TRUE(config_.set_ttl(30, TimeUnit::SECONDS).ok());

  auto status = config_.set_ttl(99, std::nullopt);
  EXPECT_TRUE(status.IsInvalid()) << status.ToString();
  EXPECT_EQ(config_.get_ttl(), 30);
  EXPECT_EQ(config_.get_ttl_unit(), TimeUnit::SECONDS);
}

// Setters return Status instead of chaining; a sequence stops at the first
// rejected step and leaves the later fields untouched.
arrow::Status configure(PoolConfig<Connection>& config, int size, int64_t ttl,
                        std::optional<TimeUnit> unit) {
  ARROW_RETURN_NOT_OK(config.set_size(size));
  ARROW_RETURN_NOT_OK(config.set_ttl(ttl, unit));
  return config.validate();
}

TEST_F(PoolConfigTest, SequencedSettersStopAtFirstRejection) {
  ASSERT_TRUE(configure(config_, 3, 20, TimeUnit::SECONDS).ok());
  EXPECT_EQ(config_.get_size(), 3);
  EXPECT_EQ(config_.get_ttl(), 20);

  auto status = configure(config_, 0, 99, TimeUnit::HOURS);
  EXPECT_TRUE(status.IsInvalid()) << status.ToString();
  EXPECT_EQ(config_.get_size(), 3);
  EXPECT_EQ(config_.get_ttl(), 20);
  EXPECT_EQ(config_.get_ttl_unit(), TimeUnit::SECONDS);
}

TEST_F(PoolConfigTest, RelaxedAcceptsMissingTtlUnit) {
  config_.relax_validation();
  ASSERT_TRUE(config_.set_ttl(99, std::nullopt).ok());
  EXPECT_EQ(config_.get_ttl(), 99);
  EXPECT_FALSE(config_.get_ttl_unit().has_value());

  EXPECT_TRUE(config_.ttl_millis().status().IsInvalid());
  EXPECT_TRUE(config_.validate().IsInvalid());
}

TEST_F(PoolConfigTest, TtlMillis) {
  EXPECT_EQ(config_.ttl_millis().ValueOrDie(), 10 * 60 * 1000);

  ASSERT_TRUE(config_.set_ttl(1500, TimeUnit::MICROSECONDS).ok());
  EXPECT_EQ(config_.ttl_millis().ValueOrDie(), 1);
}

TEST_F(PoolConfigTest, AllocatorIsStoredAndReturned) {
  config_.set_allocator(allocator_);
  EXPECT_EQ(config_.get_allocator(), allocator_);

  auto element = config_.get_allocator()->allocate().ValueOrDie();
  ASSERT_NE(element, nullptr);
  EXPECT_TRUE(config_.get_allocator()->deallocate(element).ok());
  EXPECT_EQ(allocator_->allocated(), 1);
  EXPECT_EQ(allocator_->deallocated(), 1);

  config_.set_allocator(nullptr);
  EXPECT_EQ(config_.get_allocator(), nullptr);
}

TEST_F(PoolConfigTest, PropagateToCopiesAllFields) {
  ASSERT_TRUE(config_.set_size(3).ok());
  ASSERT_TRUE(config_.set_ttl(30, TimeUnit::SECONDS).ok());
  config_.set_allocator(allocator_);

  PoolConfig<Connection> target;
  config_.propagate_to(target);

  EXPECT_EQ(target.get_size(), 3);
  EXPECT_EQ(target.get_ttl(), 30);
  EXPECT_EQ(target.get_ttl_unit(), TimeUnit::SECONDS);
  EXPECT_EQ(target.get_allocator(), allocator_);
  EXPECT_EQ(target.get_validation_policy(), ValidationPolicy::STRICT);
}

TEST_F(PoolConfigTest, PropagateToFreshTarget) {
  ASSERT_TRUE(config_.set_ttl(30, TimeUnit::SECONDS).ok());

  PoolConfig<Connection> target;
  config_.propagate_to(target);
  EXPECT_EQ(target.get_ttl(), 30);
  EXPECT_EQ(target.get_ttl_unit(), TimeUnit::SECONDS);
  EXPECT_EQ(target.get_size(), 10);
}

TEST_F(PoolConfigTest, PropagatedCopyIsIndependent) {
  PoolConfig<Connection> target;
  config_.propagate_to(target);

  ASSERT_TRUE(config_.set_size(99).ok());
  ASSERT_TRUE(config_.set_ttl(1, TimeUnit::HOURS).ok());
  config_.set_allocator(allocator_);

  EXPECT_EQ(target.get_size(), 10);
  EXPECT_EQ(target.get_ttl(), 10);
  EXPECT_EQ(target.get_ttl_unit(), TimeUnit::MINUTES);
  EXPECT_EQ(target.get_allocator(), nullptr);

  ASSERT_TRUE(target.set_size(4).ok());
  EXPECT_EQ(config_.get_size(), 99);
}

TEST_F(PoolConfigTest, PropagateCarriesRelaxedPolicy) {
  config_.relax_validation();
  ASSERT_TRUE(config_.set_size(0).ok());

  PoolConfig<Connection> target;
  config_.propagate_to(target);
  EXPECT_EQ(target.get_validation_policy(), ValidationPolicy::RELAXED);
  EXPECT_EQ(target.get_size(), 0);
  EXPECT_TRUE(target.set_size(-1).ok());
}

TEST_F(PoolConfigTest, PropagateToSelfIsNoop) {
  ASSERT_TRUE(config_.set_size(5).ok());
  config_.propagate_to(config_);
  EXPECT_EQ(config_.get_size(), 5);
}

TEST_F(PoolConfigTest, CopyConstructionAndAssignment) {
  ASSERT_TRUE(config_.set_size(2).ok());
  config_.set_allocator(allocator_);

  PoolConfig<Connection> copy(config_);
  EXPECT_EQ(copy.get_size(), 2);
  EXPECT_EQ(copy.get_allocator(), allocator_);

  PoolConfig<Connection> assigned;
  assigned = config_;
  EXPECT_EQ(assigned.get_size(), 2);

  ASSERT_TRUE(config_.set_size(8).ok());
  EXPECT_EQ(copy.get_size(), 2);
  EXPECT_EQ(assigned.get_size(), 2);
}

TEST_F(PoolConfigTest, RebindChangesElementType) {
  ASSERT_TRUE(config_.set_size(4).ok());
  ASSERT_TRUE(config_.set_ttl(45, TimeUnit::SECONDS).ok());
  config_.set_allocator(allocator_);

  auto session_allocator = std::make_shared<CountingAllocator<Session>>();
  PoolConfig<Session> sessions = config_.rebind<Session>(session_allocator);

  EXPECT_EQ(sessions.get_size(), 4);
  EXPECT_EQ(sessions.get_ttl(), 45);
  EXPECT_EQ(sessions.get_ttl_unit(), TimeUnit::SECONDS);
  EXPECT_EQ(sessions.get_allocator(), session_allocator);
  EXPECT_EQ(sessions.get_validation_policy(), ValidationPolicy::STRICT);

  // the source keeps its own allocator
  EXPECT_EQ(config_.get_allocator(), allocator_);
}

TEST_F(PoolConfigTest, ConcurrentPropagationDoesNotDeadlock) {
  PoolConfig<Connection> other;
  ASSERT_TRUE(config_.set_size(3).ok());
  ASSERT_TRUE(other.set_size(6).ok());

  constexpr int kIterations = 10000;
  std::thread forward([&] {
    for (int i = 0; i < kIterations; ++i) {
      config_.propagate_to(other);
    }
  });
  std::thread backward([&] {
    for (int i = 0; i < kIterations; ++i) {
      other.propagate_to(config_);
    }
  });
  forward.join();
  backward.join();

  int size = config_.get_size();
  EXPECT_TRUE(size == 3 || size == 6);
  EXPECT_EQ(other.get_size(), size);
}

TEST_F(PoolConfigTest, ConcurrentMutationKeepsLastValidValue) {
  std::vector<std::thread> writers;
  std::atomic<int> rejected{0};
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&, t] {
      for (int i = 0; i < 1000; ++i) {
        // odd threads try invalid sizes
        int size = (t % 2 == 0) ? i + 1 : -i;
        if (!config_.set_size(size).ok()) {
          rejected.fetch_add(1);
        }
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }

  // every size from the odd threads is below one
  EXPECT_EQ(rejected.load(), 2 * 1000);
  EXPECT_GE(config_.get_size(), 1);
}

}  // namespace poolcore
