#pragma once

#include "tiered_cache/cache.hpp"

#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace tiered_cache {

struct LocalCacheConfig {
  std::int64_t default_ttl_seconds{300};
  // Soft cap on stored entries; 0 disables it. Oldest-created entries are
  // evicted first.
  std::size_t max_entries{0};
  std::size_t max_key_len{512};
  NowFn now{};
};

// In-process TTL cache. Every operation holds one mutex for the duration of
// the map access only; dead entries are dropped on read or by sweep_expired().
class LocalCache final : public ICache {
public:
  explicit LocalCache(LocalCacheConfig cfg = {});

  LocalCache(const LocalCache &) = delete;
  LocalCache &operator=(const LocalCache &) = delete;

  std::string name() const override { return "local"; }

  std::optional<Bytes> get(const std::string &key,
                           Error *err = nullptr) override;
  bool put(const std::string &key, const Bytes &value,
           std::optional<std::int64_t> ttl_seconds = std::nullopt,
           Error *err = nullptr) override;
  bool del(const std::string &key, Error *err = nullptr) override;
  bool exists(const std::string &key, Error *err = nullptr) override;
  void clear() override;
  CacheStats stats() const override;

  std::size_t sweep_expired();
  std::optional<Entry> peek(const std::string &key) const;
  std::string info() const;

  std::size_t size() const;
  std::int64_t default_ttl_seconds() const { return cfg_.default_ttl_seconds; }

private:
  struct Slot {
    Entry entry;
    std::list<std::string>::iterator order;
  };
  using Map = std::unordered_map<std::string, Slot>;

  TimePoint now() const;
  CacheStats stats_locked() const;
  void erase_locked(Map::iterator it, bool eviction, bool expiration);
  void evict_until_fit_locked();

  LocalCacheConfig cfg_;
  mutable std::mutex mu_;
  Map entries_;
  // Keys by creation time, oldest first.
  std::list<std::string> creation_order_;
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
  std::uint64_t expirations_{0};
  std::uint64_t evictions_{0};
};

} // namespace tiered_cache
