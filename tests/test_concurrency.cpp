#include <catch2/catch.hpp>
#include "tiered_cache/local_cache.hpp"
#include "tiered_cache/sweeper.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace tiered_cache;

TEST_CASE("concurrent readers and writers on one key leave one written value",
          "[concurrency]") {
  LocalCache c;
  constexpr int kThreads = 100;
  std::set<Bytes> written;
  for (int i = 0; i < kThreads; ++i)
    written.insert(Bytes(64, static_cast<std::uint8_t>(i)));

  std::atomic<int> torn{0};
  std::atomic<bool> go{false};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      while (!go.load())
        std::this_thread::yield();
      const Bytes mine(64, static_cast<std::uint8_t>(i));
      for (int n = 0; n < 200; ++n) {
        if ((n + i) % 2 == 0) {
          c.put("shared", mine, 60);
        } else if (auto v = c.get("shared")) {
          if (written.count(*v) == 0)
            ++torn;
        }
      }
    });
  }
  go.store(true);
  for (auto &t : threads)
    t.join();

  CHECK(torn.load() == 0);
  auto final_value = c.get("shared");
  REQUIRE(final_value.has_value());
  CHECK(written.count(*final_value) == 1);
  CHECK(c.size() == 1);
}

TEST_CASE("chaos churn keeps the soft cap", "[concurrency][chaos]") {
  LocalCache c({2, 256, 512, {}});
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&c, t] {
      std::mt19937_64 rng(42 + t);
      for (int i = 0; i < 5000; ++i) {
        const auto key = std::string("k") + std::to_string(rng() % 2000);
        switch (rng() % 4) {
        case 0:
          c.put(key, Bytes(static_cast<std::size_t>(rng() % 128 + 1), 'a'),
                static_cast<std::int64_t>(rng() % 3 + 1));
          break;
        case 1:
          c.get(key);
          break;
        case 2:
          c.del(key);
          break;
        default:
          c.sweep_expired();
          break;
        }
      }
    });
  }
  for (auto &t : threads)
    t.join();
  CHECK(c.size() <= 256);
}

TEST_CASE("INFO reports keys and top-k from one snapshot",
          "[concurrency][info]") {
  LocalCache c;
  std::atomic<bool> stop{false};
  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&c, &stop, t] {
      int n = 0;
      while (!stop.load()) {
        const auto key = "w" + std::to_string(t) + "-" + std::to_string(n++);
        c.put(key, Bytes(8, 'x'), 60);
        c.del(key);
      }
    });
  }

  int mismatches = 0;
  for (int i = 0; i < 2000; ++i) {
    const auto info = c.info();
    const auto keys_at = info.find("keys:") + 5;
    const auto keys =
        std::stoul(info.substr(keys_at, info.find('\n', keys_at) - keys_at));
    const auto topk_at = info.find("topk_hits:") + 10;
    const auto topk = info.substr(topk_at, info.find('\n', topk_at) - topk_at);
    std::size_t listed = 0;
    if (!topk.empty())
      listed = static_cast<std::size_t>(
                   std::count(topk.begin(), topk.end(), ',')) +
               1;
    if (listed != std::min<std::size_t>(5, keys))
      ++mismatches;
  }
  stop.store(true);
  for (auto &t : writers)
    t.join();
  CHECK(mismatches == 0);
}

TEST_CASE("periodic sweeper removes expired entries in the background",
          "[concurrency][sweep]") {
  LocalCache c;
  for (int i = 0; i < 10; ++i)
    REQUIRE(c.put("k" + std::to_string(i), Bytes{1}, 1));
  REQUIRE(c.put("keep", Bytes{2}, 3600));

  PeriodicSweeper sweeper(c, std::chrono::milliseconds(50));
  sweeper.start();
  CHECK(sweeper.running());
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (c.size() > 1 && std::chrono::steady_clock::now() < deadline)
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  sweeper.stop();

  CHECK_FALSE(sweeper.running());
  CHECK(c.size() == 1);
  CHECK(c.exists("keep"));
  CHECK(sweeper.removed() == 10);
  CHECK(sweeper.sweeps() >= 1);
}
