#include <benchmark/benchmark.h>

#include <memory>

#include "../include/clock_service.hpp"

namespace poolcore::benchmark {

// Cost of one read on the hot path, cached tick vs system_clock
void BM_ApproximateRead(::benchmark::State& state) {
  ClockService clock(make_clock_config().with_precise(false).build());
  clock.start();
  for (auto _ : state) {
    ::benchmark::DoNotOptimize(clock.current_time_millis());
  }
  clock.stop();
}

void BM_PreciseRead(::benchmark::State& state) {
  ClockService clock(make_clock_config().with_precise(true).build());
  clock.start();
  for (auto _ : state) {
    ::benchmark::DoNotOptimize(clock.current_time_millis());
  }
  clock.stop();
}

void BM_Tick(::benchmark::State& state) {
  ClockService clock(make_clock_config().build());
  for (auto _ : state) {
    ::benchmark::DoNotOptimize(clock.tick());
  }
}

// Readers on every thread while one ticker writes
void BM_ApproximateReadContended(::benchmark::State& state) {
  static std::unique_ptr<ClockService> shared_clock;
  if (state.thread_index() == 0) {
    shared_clock = std::make_unique<ClockService>(make_clock_config().build());
    shared_clock->start();
  }
  for (auto _ : state) {
    ::benchmark::DoNotOptimize(shared_clock->current_time_millis());
  }
  if (state.thread_index() == 0) {
    shared_clock.reset();
  }
}

}  // namespace poolcore::benchmark

BENCHMARK(poolcore::benchmark::BM_ApproximateRead);
BENCHMARK(poolcore::benchmark::BM_PreciseRead);
BENCHMARK(poolcore::benchmark::BM_Tick);
BENCHMARK(poolcore::benchmark::BM_ApproximateReadContended)->ThreadRange(1, 8);

BENCHMARK_MAIN();
