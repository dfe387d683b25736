#pragma once

#include "tiered_cache/cache.hpp"
#include "tiered_cache/cache_key.hpp"
#include "tiered_cache/codec.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace tiered_cache {

struct MemoizeOptions {
  // Empty selects the cache's own default TTL.
  std::optional<std::int64_t> ttl_seconds;
  std::string key_prefix{"memo"};
  // Keys outside (0, max_key_len] are rejected before the target runs.
  std::size_t max_key_len{512};
};

struct MemoStats {
  std::uint64_t calls{0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  // Calls where the cache failed softly and the target ran uncached.
  std::uint64_t fallbacks{0};
};

template <typename Signature> class Memoized;

// Wraps a callable so repeated calls with the same arguments within the TTL
// are answered from the cache. Concurrent misses on one key may each invoke
// the target; there is no request coalescing.
template <typename R, typename... Args> class Memoized<R(Args...)> {
  static_assert(!std::is_void_v<R>, "a memoized function must return a value");

public:
  using Function = std::function<R(Args...)>;
  using KeyFunction = std::function<std::string(const std::decay_t<Args> &...)>;

  Memoized(ICache &cache, std::string name, Function fn,
           MemoizeOptions opts = {}, KeyFunction key_fn = {})
      : cache_(&cache), name_(std::move(name)), fn_(std::move(fn)),
        opts_(std::move(opts)), key_fn_(std::move(key_fn)),
        counters_(std::make_shared<Counters>()) {
    if (opts_.ttl_seconds && *opts_.ttl_seconds <= 0)
      throw CacheError(ErrorCode::InvalidTtl,
                       "memoize ttl must be positive, got " +
                           std::to_string(*opts_.ttl_seconds));
    if (!fn_)
      throw std::invalid_argument("memoize target is empty");
  }

  R operator()(Args... args) const {
    ++counters_->calls;
    const std::string key = key_for(args...);
    if (key.empty() || key.size() > opts_.max_key_len)
      throw CacheError(ErrorCode::InvalidKey,
                       "memoize key length " + std::to_string(key.size()) +
                           " outside 1.." + std::to_string(opts_.max_key_len));

    Error err;
    if (auto cached = cache_->get(key, &err)) {
      R value{};
      std::string msg;
      if (!decode_value(*cached, value, &msg))
        throw CacheError(ErrorCode::Serialization, key + ": " + msg);
      ++counters_->hits;
      return value;
    }
    if (err.soft())
      ++counters_->fallbacks;
    else if (!err.ok())
      throw CacheError(err);
    ++counters_->misses;

    R value = fn_(args...);

    Bytes encoded;
    std::string msg;
    if (!encode_value(value, encoded, &msg))
      throw CacheError(ErrorCode::Serialization, key + ": " + msg);
    Error put_err;
    if (!cache_->put(key, encoded, opts_.ttl_seconds, &put_err)) {
      if (!put_err.soft())
        throw CacheError(put_err);
      ++counters_->fallbacks;
    }
    return value;
  }

  std::string key_for(const std::decay_t<Args> &...args) const {
    if (key_fn_)
      return key_fn_(args...);
    return make_cache_key(opts_.key_prefix, name_, key_repr(args...));
  }

  // Drops every entry of the underlying cache.
  void invalidate() { cache_->clear(); }
  bool invalidate_call(const std::decay_t<Args> &...args) {
    return cache_->del(key_for(args...));
  }
  bool invalidate_key(const std::string &key) { return cache_->del(key); }

  CacheStats statistics() const { return cache_->stats(); }

  MemoStats memo_stats() const {
    MemoStats s;
    s.calls = counters_->calls.load();
    s.hits = counters_->hits.load();
    s.misses = counters_->misses.load();
    s.fallbacks = counters_->fallbacks.load();
    return s;
  }

  const std::string &name() const { return name_; }

private:
  struct Counters {
    std::atomic<std::uint64_t> calls{0};
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
    std::atomic<std::uint64_t> fallbacks{0};
  };

  ICache *cache_;
  std::string name_;
  Function fn_;
  MemoizeOptions opts_;
  KeyFunction key_fn_;
  // Shared so copies of the wrapper report one set of counters.
  std::shared_ptr<Counters> counters_;
};

template <typename Signature, typename F>
Memoized<Signature> memoize(ICache &cache, std::string name, F &&fn,
                            MemoizeOptions opts = {}) {
  return Memoized<Signature>(cache, std::move(name),
                             std::function<Signature>(std::forward<F>(fn)),
                             std::move(opts));
}

template <typename Signature, typename F, typename K>
Memoized<Signature> memoize(ICache &cache, std::string name, F &&fn,
                            MemoizeOptions opts, K &&key_fn) {
  return Memoized<Signature>(
      cache, std::move(name), std::function<Signature>(std::forward<F>(fn)),
      std::move(opts),
      typename Memoized<Signature>::KeyFunction(std::forward<K>(key_fn)));
}

} // namespace tiered_cache
