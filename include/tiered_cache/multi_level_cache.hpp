#pragma once

#include "tiered_cache/cache.hpp"
#include "tiered_cache/local_cache.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace tiered_cache {

struct MultiLevelStats {
  CacheStats l1;
  CacheStats l2;
  std::uint64_t backfills{0};
  std::uint64_t remote_write_failures{0};
};

// Read-through/write-through composition of an in-process L1 and a shared L2.
// Both tiers are borrowed and must outlive this object. L2 failures of class
// BackendUnavailable are absorbed: reads fall back to a miss, writes keep the
// L1 copy. There is no cross-instance invalidation, so another process may
// serve its own stale L1 copy until that copy's TTL elapses.
class MultiLevelCache final : public ICache {
public:
  MultiLevelCache(LocalCache &l1, ICache &l2);

  std::string name() const override;

  std::optional<Bytes> get(const std::string &key,
                           Error *err = nullptr) override;
  bool put(const std::string &key, const Bytes &value,
           std::optional<std::int64_t> ttl_seconds = std::nullopt,
           Error *err = nullptr) override;
  bool del(const std::string &key, Error *err = nullptr) override;
  bool exists(const std::string &key, Error *err = nullptr) override;
  void clear() override;
  CacheStats stats() const override;

  MultiLevelStats tier_stats() const;

  LocalCache &l1() { return l1_; }
  ICache &l2() { return l2_; }

private:
  LocalCache &l1_;
  ICache &l2_;
  std::atomic<std::uint64_t> backfills_{0};
  std::atomic<std::uint64_t> remote_write_failures_{0};
};

} // namespace tiered_cache
