#include "tiered_cache/config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace tiered_cache {
namespace {
bool parse_i64(const std::string &s, std::int64_t &out) {
  if (s.empty())
    return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

bool parse_u64(const std::string &s, std::uint64_t &out) {
  if (s.empty())
    return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

// Returns false only for a present but malformed value.
bool extract_i64(const std::string &text, const std::string &key,
                 std::int64_t &out, bool &found) {
  std::regex re("\"" + key + "\"\\s*:\\s*(-?[0-9]+)\\s*([,}])");
  std::smatch m;
  found = false;
  if (!std::regex_search(text, m, re)) {
    std::regex any("\"" + key + "\"\\s*:");
    return !std::regex_search(text, any);
  }
  found = true;
  return parse_i64(m[1].str(), out);
}

bool extract_string(const std::string &text, const std::string &key,
                    std::string &out) {
  std::regex re("\"" + key + "\"\\s*:\\s*\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(text, m, re))
    return false;
  out = m[1].str();
  return true;
}

const char *env(const char *name) {
  const char *v = std::getenv(name);
  return (v && *v) ? v : nullptr;
}

bool fail(std::string *err, const std::string &msg) {
  if (err)
    *err = msg;
  return false;
}
} // namespace

bool load_config_from_env(CacheConfig &cfg, std::string *err) {
  CacheConfig next = cfg;
  std::int64_t i = 0;
  std::uint64_t u = 0;
  if (const char *v = env("TIERED_CACHE_LOCAL_TTL")) {
    if (!parse_i64(v, i))
      return fail(err, "TIERED_CACHE_LOCAL_TTL is not an integer");
    next.local.default_ttl_seconds = i;
  }
  if (const char *v = env("TIERED_CACHE_REMOTE_TTL")) {
    if (!parse_i64(v, i))
      return fail(err, "TIERED_CACHE_REMOTE_TTL is not an integer");
    next.remote.default_ttl_seconds = i;
  }
  if (const char *v = env("TIERED_CACHE_REMOTE_URL"))
    next.remote.connection = v;
  if (const char *v = env("TIERED_CACHE_MAX_ENTRIES")) {
    if (!parse_u64(v, u))
      return fail(err, "TIERED_CACHE_MAX_ENTRIES is not an unsigned integer");
    next.local.max_entries = static_cast<std::size_t>(u);
  }
  if (const char *v = env("TIERED_CACHE_REMOTE_TIMEOUT_MS")) {
    if (!parse_u64(v, u))
      return fail(err,
                  "TIERED_CACHE_REMOTE_TIMEOUT_MS is not an unsigned integer");
    next.remote.timeout_ms = u;
    next.remote.connect_timeout_ms = u;
  }
  if (const char *v = env("TIERED_CACHE_KEY_PREFIX"))
    next.remote.key_prefix = v;
  if (const char *v = env("TIERED_CACHE_SWEEP_INTERVAL_MS")) {
    if (!parse_u64(v, u))
      return fail(err,
                  "TIERED_CACHE_SWEEP_INTERVAL_MS is not an unsigned integer");
    next.sweep_interval_ms = u;
  }
  cfg = std::move(next);
  return true;
}

bool load_config_file(const std::string &path, CacheConfig &cfg,
                      std::string *err) {
  std::ifstream in(path);
  if (!in.is_open())
    return fail(err, "config file not found: " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (text.find('{') == std::string::npos ||
      text.find('}') == std::string::npos)
    return fail(err, "invalid schema");

  CacheConfig next = cfg;
  std::int64_t v = 0;
  bool found = false;
  auto read_int = [&](const char *key) {
    if (!extract_i64(text, key, v, found))
      return fail(err, std::string("invalid integer for ") + key);
    return true;
  };

  if (!read_int("local_ttl"))
    return false;
  if (found)
    next.local.default_ttl_seconds = v;
  if (!read_int("remote_ttl"))
    return false;
  if (found)
    next.remote.default_ttl_seconds = v;
  if (!read_int("max_entries"))
    return false;
  if (found) {
    if (v < 0)
      return fail(err, "max_entries must not be negative");
    next.local.max_entries = static_cast<std::size_t>(v);
  }
  if (!read_int("remote_timeout_ms"))
    return false;
  if (found) {
    if (v <= 0)
      return fail(err, "remote_timeout_ms must be positive");
    next.remote.timeout_ms = static_cast<std::uint64_t>(v);
    next.remote.connect_timeout_ms = static_cast<std::uint64_t>(v);
  }
  if (!read_int("sweep_interval_ms"))
    return false;
  if (found) {
    if (v < 0)
      return fail(err, "sweep_interval_ms must not be negative");
    next.sweep_interval_ms = static_cast<std::uint64_t>(v);
  }
  if (!read_int("pool_size"))
    return false;
  if (found) {
    if (v <= 0)
      return fail(err, "pool_size must be positive");
    next.remote.pool_size = static_cast<std::size_t>(v);
  }

  std::string s;
  if (extract_string(text, "remote_url", s))
    next.remote.connection = s;
  if (extract_string(text, "key_prefix", s))
    next.remote.key_prefix = s;

  cfg = std::move(next);
  return true;
}

bool validate_config(const CacheConfig &cfg, std::string *err) {
  if (cfg.local.default_ttl_seconds <= 0)
    return fail(err, "local default ttl must be positive");
  if (cfg.remote.default_ttl_seconds <= 0)
    return fail(err, "remote default ttl must be positive");
  if (cfg.remote.timeout_ms == 0 || cfg.remote.connect_timeout_ms == 0)
    return fail(err, "remote timeouts must be positive");
  if (cfg.remote.pool_size == 0)
    return fail(err, "pool size must be positive");
  if (cfg.local.max_key_len == 0 || cfg.remote.max_key_len == 0)
    return fail(err, "max key length must be positive");
  ConnectionOptions opts;
  std::string msg;
  if (!parse_connection_string(cfg.remote.connection, opts, &msg))
    return fail(err, "remote connection: " + msg);
  return true;
}

} // namespace tiered_cache
