#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "../include/clock_service.hpp"
#include "../include/config.hpp"
#include "../include/logger.hpp"
#include "../include/pool_config.hpp"

using namespace poolcore;

struct Connection {
  std::string endpoint;
  int64_t created_at_millis = 0;
};

class ConnectionAllocator : public Allocator<Connection> {
 public:
  ConnectionAllocator(std::string endpoint, std::shared_ptr<ClockService> clock)
      : endpoint_(std::move(endpoint)), clock_(std::move(clock)) {}

  arrow::Result<std::shared_ptr<Connection>> allocate() override {
    auto connection = std::make_shared<Connection>();
    connection->endpoint = endpoint_;
    connection->created_at_millis = clock_->current_time_millis();
    return connection;
  }

  arrow::Status deallocate(std::shared_ptr<Connection> connection) override {
    if (!connection) {
      return arrow::Status::Invalid("null connection");
    }
    log_debug("closing connection to {}", connection->endpoint);
    return arrow::Status::OK();
  }

 private:
  std::string endpoint_;
  std::shared_ptr<ClockService> clock_;
};

static bool is_expired(const Connection& connection, int64_t ttl_millis,
                       const ClockService& clock) {
  return clock.current_time_millis() - connection.created_at_millis >=
         ttl_millis;
}

static arrow::Status run() {
  auto clock = ClockService::shared();
  clock->start();

  PoolConfig<Connection> config;
  ARROW_RETURN_NOT_OK(config.set_size(4));
  ARROW_RETURN_NOT_OK(config.set_ttl(50, TimeUnit::MILLISECONDS));
  config.set_allocator(
      std::make_shared<ConnectionAllocator>("db.local:5432", clock));
  ARROW_RETURN_NOT_OK(config.validate());

  // what a pool would read once at construction
  PoolConfig<Connection> pool_view;
  config.propagate_to(pool_view);
  ARROW_ASSIGN_OR_RAISE(auto ttl_millis, pool_view.ttl_millis());

  std::cout << "clock mode: "
            << (clock->is_precise() ? "precise" : "approximate")
            << ", pool size: " << pool_view.get_size()
            << ", ttl: " << pool_view.get_ttl() << " "
            << to_string(*pool_view.get_ttl_unit()) << std::endl;

  ARROW_ASSIGN_OR_RAISE(auto connection,
                        pool_view.get_allocator()->allocate());
  for (int i = 0; i < 5; ++i) {
    int64_t age = clock->current_time_millis() - connection->created_at_millis;
    std::cout << "age=" << age << "ms expired=" << std::boolalpha
              << is_expired(*connection, ttl_millis, *clock) << std::endl;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  ARROW_RETURN_NOT_OK(pool_view.get_allocator()->deallocate(connection));

  clock->stop();
  return arrow::Status::OK();
}

int main() {
  if (const char* level = std::getenv(env::LOG_LEVEL)) {
    auto parsed = parse_log_level(level);
    if (!parsed.ok()) {
      std::cerr << parsed.status().ToString() << std::endl;
      return 1;
    }
    Logger::getInstance().setLevel(parsed.ValueOrDie());
  }

  auto status = run();
  if (!status.ok()) {
    log_error("demo failed: {}", status.ToString());
    return 1;
  }
  return 0;
}
