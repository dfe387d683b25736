#include "tiered_cache/sweeper.hpp"

#include <algorithm>

namespace tiered_cache {

PeriodicSweeper::PeriodicSweeper(LocalCache &cache,
                                 std::chrono::milliseconds interval)
    : cache_(cache),
      interval_(std::max(interval, std::chrono::milliseconds(1))) {}

PeriodicSweeper::~PeriodicSweeper() { stop(); }

void PeriodicSweeper::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable())
    return;
  stop_requested_ = false;
  running_ = true;
  worker_ = std::thread([this] { run(); });
}

void PeriodicSweeper::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!worker_.joinable())
      return;
    stop_requested_ = true;
  }
  cv_.notify_all();
  worker_.join();
  running_ = false;
}

void PeriodicSweeper::run() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; }))
      break;
    lock.unlock();
    removed_ += cache_.sweep_expired();
    ++sweeps_;
    lock.lock();
  }
}

} // namespace tiered_cache
