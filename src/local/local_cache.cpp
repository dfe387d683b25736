#include "tiered_cache/local_cache.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

namespace tiered_cache {

LocalCache::LocalCache(LocalCacheConfig cfg) : cfg_(std::move(cfg)) {
  if (!cfg_.now)
    cfg_.now = [] { return Clock::now(); };
}

TimePoint LocalCache::now() const { return cfg_.now(); }

std::optional<Bytes> LocalCache::get(const std::string &key, Error *err) {
  clear_error(err);
  const auto t = now();
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    ++misses_;
    return std::nullopt;
  }
  auto &e = it->second.entry;
  if (!e.live(t)) {
    erase_locked(it, false, true);
    ++misses_;
    return std::nullopt;
  }
  e.last_access = t;
  ++e.hit_count;
  ++hits_;
  return e.value;
}

bool LocalCache::put(const std::string &key, const Bytes &value,
                     std::optional<std::int64_t> ttl_seconds, Error *err) {
  clear_error(err);
  if (key.empty() || key.size() > cfg_.max_key_len) {
    set_error(err, ErrorCode::InvalidKey, "invalid key length");
    return false;
  }
  const std::int64_t ttl = ttl_seconds.value_or(cfg_.default_ttl_seconds);
  if (ttl <= 0) {
    set_error(err, ErrorCode::InvalidTtl,
              "ttl must be positive, got " + std::to_string(ttl));
    return false;
  }

  Entry candidate;
  candidate.value = value;
  candidate.created_at = now();
  candidate.expires_at = expiry_after(candidate.created_at, ttl);
  candidate.last_access = candidate.created_at;
  candidate.hit_count = 0;
  candidate.ttl_seconds = ttl;

  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it != entries_.end())
    erase_locked(it, false, false);
  creation_order_.push_back(key);
  entries_.emplace(key, Slot{std::move(candidate),
                             std::prev(creation_order_.end())});
  evict_until_fit_locked();
  return true;
}

bool LocalCache::del(const std::string &key, Error *err) {
  clear_error(err);
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return false;
  erase_locked(it, false, false);
  return true;
}

bool LocalCache::exists(const std::string &key, Error *err) {
  clear_error(err);
  const auto t = now();
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  return it != entries_.end() && it->second.entry.live(t);
}

void LocalCache::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
  creation_order_.clear();
}

std::size_t LocalCache::sweep_expired() {
  const auto t = now();
  std::lock_guard<std::mutex> lock(mu_);
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    auto next = std::next(it);
    if (!it->second.entry.live(t)) {
      erase_locked(it, false, true);
      ++removed;
    }
    it = next;
  }
  return removed;
}

CacheStats LocalCache::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_locked();
}

CacheStats LocalCache::stats_locked() const {
  CacheStats s;
  s.entry_count = entries_.size();
  double ttl_sum = 0;
  for (const auto &[k, slot] : entries_) {
    s.total_hits += slot.entry.hit_count;
    ttl_sum += static_cast<double>(slot.entry.ttl_seconds);
  }
  if (!entries_.empty())
    s.avg_ttl_seconds = ttl_sum / static_cast<double>(entries_.size());
  s.hits = hits_;
  s.misses = misses_;
  s.expirations = expirations_;
  s.evictions = evictions_;
  return s;
}

std::optional<Entry> LocalCache::peek(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end())
    return std::nullopt;
  return it->second.entry;
}

std::size_t LocalCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

std::string LocalCache::info() const {
  CacheStats s;
  std::vector<std::pair<std::string, std::uint64_t>> counts;
  {
    std::lock_guard<std::mutex> lock(mu_);
    s = stats_locked();
    counts.reserve(entries_.size());
    for (const auto &[k, slot] : entries_)
      counts.emplace_back(k, slot.entry.hit_count);
  }
  std::sort(counts.begin(), counts.end(), [](const auto &a, const auto &b) {
    if (a.second == b.second)
      return a.first < b.first;
    return a.second > b.second;
  });

  std::ostringstream os;
  os << "tier:" << name() << "\n";
  os << "keys:" << s.entry_count << "\n";
  os << "max_entries:" << cfg_.max_entries << "\n";
  os << "default_ttl_seconds:" << cfg_.default_ttl_seconds << "\n";
  os << "avg_ttl_seconds:" << s.avg_ttl_seconds << "\n";
  os << "total_hits:" << s.total_hits << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "expirations:" << s.expirations << "\n";
  os << "evictions:" << s.evictions << "\n";
  os << "topk_hits:";
  for (std::size_t i = 0; i < std::min<std::size_t>(5, counts.size()); ++i) {
    if (i)
      os << ",";
    os << counts[i].first << ":" << counts[i].second;
  }
  os << "\n";
  return os.str();
}

void LocalCache::erase_locked(Map::iterator it, bool eviction,
                              bool expiration) {
  creation_order_.erase(it->second.order);
  entries_.erase(it);
  if (eviction)
    ++evictions_;
  if (expiration)
    ++expirations_;
}

void LocalCache::evict_until_fit_locked() {
  if (cfg_.max_entries == 0)
    return;
  while (entries_.size() > cfg_.max_entries && !creation_order_.empty()) {
    auto victim = entries_.find(creation_order_.front());
    if (victim == entries_.end()) {
      creation_order_.pop_front();
      continue;
    }
    erase_locked(victim, true, false);
  }
}

} // namespace tiered_cache
