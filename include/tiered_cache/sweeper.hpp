#pragma once

#include "tiered_cache/local_cache.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace tiered_cache {

// Background thread that calls LocalCache::sweep_expired() at a fixed
// interval. The cache must outlive the sweeper.
class PeriodicSweeper {
public:
  PeriodicSweeper(LocalCache &cache, std::chrono::milliseconds interval);
  ~PeriodicSweeper();

  PeriodicSweeper(const PeriodicSweeper &) = delete;
  PeriodicSweeper &operator=(const PeriodicSweeper &) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  std::uint64_t sweeps() const { return sweeps_.load(); }
  std::uint64_t removed() const { return removed_.load(); }

private:
  void run();

  LocalCache &cache_;
  std::chrono::milliseconds interval_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::thread worker_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> sweeps_{0};
  std::atomic<std::uint64_t> removed_{0};
};

} // namespace tiered_cache
