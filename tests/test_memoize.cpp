#include "tiered_cache/memoize.hpp"
#include "tiered_cache/local_cache.hpp"
#include "tiered_cache/multi_level_cache.hpp"
#include "tiered_cache/remote_cache.hpp"
#include "support/fake_redis.hpp"
#include "support/manual_clock.hpp"

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace tiered_cache;

namespace {
using InstanceList = std::vector<std::string>;

MemoizeOptions ttl(std::int64_t seconds) {
  MemoizeOptions opts;
  opts.ttl_seconds = seconds;
  return opts;
}

class UnavailableTier final : public ICache {
public:
  std::string name() const override { return "down"; }
  std::optional<Bytes> get(const std::string &, Error *err) override {
    set_error(err, ErrorCode::BackendUnavailable, "down");
    return std::nullopt;
  }
  bool put(const std::string &, const Bytes &, std::optional<std::int64_t>,
           Error *err) override {
    set_error(err, ErrorCode::BackendUnavailable, "down");
    return false;
  }
  bool del(const std::string &, Error *err) override {
    set_error(err, ErrorCode::BackendUnavailable, "down");
    return false;
  }
  bool exists(const std::string &, Error *) override { return false; }
  void clear() override {}
  CacheStats stats() const override { return {}; }
};
} // namespace

namespace billing {
struct Query {
  std::string account;
  int month{1};
};

std::string cache_key_repr(const Query &q) {
  return q.account + "/" + std::to_string(q.month);
}
} // namespace billing

TEST_CASE("repeated calls within the ttl invoke the target once",
          "[memoize]") {
  LocalCache cache;
  int calls = 0;
  auto square = memoize<long(int)>(
      cache, "square",
      [&calls](int x) {
        ++calls;
        return static_cast<long>(x) * x;
      },
      ttl(60));

  CHECK(square(12) == 144);
  CHECK(square(12) == 144);
  CHECK(calls == 1);
  CHECK(square(13) == 169);
  CHECK(calls == 2);

  const auto m = square.memo_stats();
  CHECK(m.calls == 3);
  CHECK(m.hits == 1);
  CHECK(m.misses == 2);
  CHECK(m.fallbacks == 0);
}

TEST_CASE("inventory lookup is served from cache until its ttl elapses",
          "[memoize][scenario]") {
  testing::ManualClock clock;
  LocalCache cache({300, 0, 512, clock.fn()});
  int api_calls = 0;
  auto list_instances = memoize<InstanceList(const std::string &)>(
      cache, "list_instances",
      [&api_calls](const std::string &region) {
        ++api_calls;
        return InstanceList{region + "/i-0a1", region + "/i-0b2"};
      },
      ttl(300), [](const std::string &region) { return "ec2:" + region; });

  const auto first = list_instances("us-east-1");
  CHECK(api_calls == 1);
  CHECK(cache.exists("ec2:us-east-1"));

  clock.advance_seconds(299);
  CHECK(list_instances("us-east-1") == first);
  CHECK(api_calls == 1);

  clock.advance_seconds(2);
  CHECK_FALSE(cache.get("ec2:us-east-1").has_value());
  CHECK(list_instances("us-east-1") == first);
  CHECK(api_calls == 2);
}

TEST_CASE("target exceptions propagate and are not cached",
          "[memoize][errors]") {
  LocalCache cache;
  int calls = 0;
  auto flaky = memoize<int(int)>(cache, "flaky", [&calls](int x) {
    if (++calls == 1)
      throw std::runtime_error("throttled");
    return x + 1;
  });

  REQUIRE_THROWS_AS(flaky(1), std::runtime_error);
  CHECK(cache.stats().entry_count == 0);
  CHECK(flaky(1) == 2);
  CHECK(flaky(1) == 2);
  CHECK(calls == 2);
}

TEST_CASE("an unavailable cache falls through to the target",
          "[memoize][errors]") {
  UnavailableTier down;
  int calls = 0;
  auto f = memoize<std::string(std::string)>(down, "echo",
                                             [&calls](std::string s) {
                                               ++calls;
                                               return s + "!";
                                             });
  CHECK(f("a") == "a!");
  CHECK(f("a") == "a!");
  CHECK(calls == 2);
  CHECK(f.memo_stats().fallbacks == 4);
}

TEST_CASE("memoization over both tiers survives a dead backend",
          "[memoize][multi]") {
  RemoteCacheConfig cfg;
  cfg.connection = "redis://127.0.0.1:1";
  cfg.log_errors = false;
  RemoteCacheClient remote(cfg);
  LocalCache local;
  MultiLevelCache cache(local, remote);

  int calls = 0;
  auto f = memoize<int(int)>(cache, "inc", [&calls](int x) {
    ++calls;
    return x + 1;
  });
  CHECK(f(1) == 2);
  CHECK(f(1) == 2);
  CHECK(calls == 1);
}

TEST_CASE("memoized results are shared through the remote tier",
          "[memoize][multi]") {
  testing::FakeRedis server;
  RemoteCacheConfig cfg;
  cfg.connection = server.url();
  cfg.log_errors = false;
  RemoteCacheClient remote(cfg);

  int calls = 0;
  auto target = [&calls](const billing::Query &q) {
    ++calls;
    return std::map<std::string, double>{{q.account, 10.5 * q.month}};
  };
  using Sig = std::map<std::string, double>(const billing::Query &);

  LocalCache local_a;
  MultiLevelCache a(local_a, remote);
  auto invoice_a = memoize<Sig>(a, "invoice", target);

  LocalCache local_b;
  MultiLevelCache b(local_b, remote);
  auto invoice_b = memoize<Sig>(b, "invoice", target);

  const billing::Query q{"acct-7", 3};
  const auto expected = std::map<std::string, double>{{"acct-7", 31.5}};
  CHECK(invoice_a(q) == expected);
  CHECK(invoice_b(q) == expected);
  CHECK(calls == 1);
  CHECK(invoice_a.key_for(q) == invoice_b.key_for(q));
}

TEST_CASE("invalidation drops one call or the whole cache", "[memoize]") {
  LocalCache cache;
  int calls = 0;
  auto f = memoize<int(int, int)>(cache, "add", [&calls](int a, int b) {
    ++calls;
    return a + b;
  });

  f(1, 2);
  f(3, 4);
  CHECK(calls == 2);

  CHECK(f.invalidate_call(1, 2));
  CHECK_FALSE(f.invalidate_call(1, 2));
  f(1, 2);
  f(3, 4);
  CHECK(calls == 3);

  CHECK(f.invalidate_key(f.key_for(3, 4)));
  f(3, 4);
  CHECK(calls == 4);

  f.invalidate();
  CHECK(f.statistics().entry_count == 0);
  f(1, 2);
  CHECK(calls == 5);
}

TEST_CASE("statistics delegate to the underlying cache", "[memoize][stats]") {
  LocalCache cache;
  auto f = memoize<int(int)>(cache, "id", [](int x) { return x; }, ttl(120));
  f(1);
  f(1);
  f(2);
  const auto s = f.statistics();
  CHECK(s.entry_count == 2);
  CHECK(s.avg_ttl_seconds == 120.0);
  CHECK(s.hits == cache.stats().hits);
}

TEST_CASE("zero-argument targets are memoized", "[memoize]") {
  LocalCache cache;
  int calls = 0;
  auto f = memoize<std::string()>(cache, "config", [&calls] {
    ++calls;
    return std::string("loaded");
  });
  CHECK(f() == "loaded");
  CHECK(f() == "loaded");
  CHECK(calls == 1);
  CHECK(f.key_for().rfind("memo:config:", 0) == 0);
}

TEST_CASE("unusable keys are rejected before the target runs",
          "[memoize][errors]") {
  LocalCache cache;
  int calls = 0;
  auto blank = memoize<int(int)>(
      cache, "blank",
      [&calls](int x) {
        ++calls;
        return x;
      },
      MemoizeOptions{}, [](const int &) { return std::string(); });
  try {
    blank(1);
    FAIL("expected CacheError");
  } catch (const CacheError &e) {
    CHECK(e.code() == ErrorCode::InvalidKey);
  }

  auto long_name = memoize<int(int)>(cache, std::string(600, 'n'),
                                     [&calls](int x) {
                                       ++calls;
                                       return x;
                                     });
  try {
    long_name(1);
    FAIL("expected CacheError");
  } catch (const CacheError &e) {
    CHECK(e.code() == ErrorCode::InvalidKey);
  }
  CHECK(calls == 0);
  CHECK(cache.stats().entry_count == 0);
}

TEST_CASE("misuse is reported as cache errors", "[memoize][errors]") {
  LocalCache cache;
  REQUIRE_THROWS_AS(
      memoize<int(int)>(cache, "bad", [](int x) { return x; }, ttl(0)),
      CacheError);
  try {
    memoize<int(int)>(cache, "bad", [](int x) { return x; }, ttl(-1));
    FAIL("expected CacheError");
  } catch (const CacheError &e) {
    CHECK(e.code() == ErrorCode::InvalidTtl);
  }

  auto f = memoize<int(int)>(cache, "typed", [](int x) { return x; });
  Bytes wrong;
  REQUIRE(encode_value(std::string("not an int"), wrong));
  REQUIRE(cache.put(f.key_for(5), wrong));
  try {
    f(5);
    FAIL("expected CacheError");
  } catch (const CacheError &e) {
    CHECK(e.code() == ErrorCode::Serialization);
  }
}
