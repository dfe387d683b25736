#include "tiered_cache/multi_level_cache.hpp"

namespace tiered_cache {

MultiLevelCache::MultiLevelCache(LocalCache &l1, ICache &l2)
    : l1_(l1), l2_(l2) {}

std::string MultiLevelCache::name() const {
  return l1_.name() + "+" + l2_.name();
}

std::optional<Bytes> MultiLevelCache::get(const std::string &key, Error *err) {
  clear_error(err);
  if (auto v = l1_.get(key))
    return v;

  Error e;
  auto v = l2_.get(key, &e);
  if (!v) {
    // A backend outage is a plain miss; decode failures are surfaced.
    if (!e.ok() && !e.soft() && err)
      *err = std::move(e);
    return std::nullopt;
  }
  // Backfill with the L1 default TTL, independent of the L2 expiry.
  if (l1_.put(key, *v, std::nullopt))
    ++backfills_;
  return v;
}

bool MultiLevelCache::put(const std::string &key, const Bytes &value,
                          std::optional<std::int64_t> ttl_seconds, Error *err) {
  clear_error(err);
  if (!l1_.put(key, value, ttl_seconds, err))
    return false;

  Error e;
  if (l2_.put(key, value, ttl_seconds, &e))
    return true;
  if (e.soft()) {
    ++remote_write_failures_;
    return true;
  }
  if (err)
    *err = std::move(e);
  return false;
}

bool MultiLevelCache::del(const std::string &key, Error *err) {
  clear_error(err);
  const bool local = l1_.del(key);
  Error e;
  const bool remote = l2_.del(key, &e);
  return local || remote;
}

bool MultiLevelCache::exists(const std::string &key, Error *err) {
  clear_error(err);
  if (l1_.exists(key))
    return true;
  Error e;
  return l2_.exists(key, &e);
}

void MultiLevelCache::clear() {
  l1_.clear();
  l2_.clear();
}

CacheStats MultiLevelCache::stats() const {
  const auto t = tier_stats();
  CacheStats s = t.l1;
  s.hits += t.l2.hits;
  // An L1 miss that L2 answered is not a miss of the composite.
  s.misses = t.l2.misses;
  s.backend_errors = t.l2.backend_errors;
  return s;
}

MultiLevelStats MultiLevelCache::tier_stats() const {
  MultiLevelStats t;
  t.l1 = l1_.stats();
  t.l2 = l2_.stats();
  t.backfills = backfills_.load();
  t.remote_write_failures = remote_write_failures_.load();
  return t;
}

} // namespace tiered_cache
