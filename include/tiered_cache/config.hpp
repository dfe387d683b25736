#pragma once

#include "tiered_cache/local_cache.hpp"
#include "tiered_cache/remote_cache.hpp"

#include <cstdint>
#include <string>

namespace tiered_cache {

struct CacheConfig {
  LocalCacheConfig local;
  RemoteCacheConfig remote;
  // 0 disables the background sweeper.
  std::uint64_t sweep_interval_ms{0};
};

// Reads TIERED_CACHE_* variables. Unset variables leave fields untouched; a
// malformed value fails the whole load and leaves cfg unchanged.
bool load_config_from_env(CacheConfig &cfg, std::string *err = nullptr);

// Flat JSON object: local_ttl, remote_ttl, remote_url, max_entries,
// remote_timeout_ms, key_prefix, sweep_interval_ms, pool_size. Same atomicity
// as load_config_from_env.
bool load_config_file(const std::string &path, CacheConfig &cfg,
                      std::string *err = nullptr);

bool validate_config(const CacheConfig &cfg, std::string *err = nullptr);

} // namespace tiered_cache
