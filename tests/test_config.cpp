#include "tiered_cache/config.hpp"

#include <catch2/catch.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace tiered_cache;

namespace {
void clear_env() {
  for (const char *name :
       {"TIERED_CACHE_LOCAL_TTL", "TIERED_CACHE_REMOTE_TTL",
        "TIERED_CACHE_REMOTE_URL", "TIERED_CACHE_MAX_ENTRIES",
        "TIERED_CACHE_REMOTE_TIMEOUT_MS", "TIERED_CACHE_KEY_PREFIX",
        "TIERED_CACHE_SWEEP_INTERVAL_MS"})
    unsetenv(name);
}

void write_file(const char *path, const std::string &text) {
  std::ofstream out(path);
  out << text;
}
} // namespace

TEST_CASE("defaults are valid", "[config]") {
  CacheConfig cfg;
  std::string err;
  CHECK(validate_config(cfg, &err));
  CHECK(cfg.local.default_ttl_seconds == 300);
  CHECK(cfg.remote.default_ttl_seconds == 3600);
  CHECK(cfg.remote.connection == "redis://127.0.0.1:6379");
  CHECK(cfg.local.max_entries == 0);
}

TEST_CASE("environment overrides selected fields", "[config][env]") {
  clear_env();
  setenv("TIERED_CACHE_LOCAL_TTL", "60", 1);
  setenv("TIERED_CACHE_REMOTE_URL", "redis://cache:6380/1", 1);
  setenv("TIERED_CACHE_MAX_ENTRIES", "10000", 1);
  setenv("TIERED_CACHE_REMOTE_TIMEOUT_MS", "75", 1);
  setenv("TIERED_CACHE_KEY_PREFIX", "svc:", 1);

  CacheConfig cfg;
  std::string err;
  REQUIRE(load_config_from_env(cfg, &err));
  CHECK(cfg.local.default_ttl_seconds == 60);
  CHECK(cfg.remote.default_ttl_seconds == 3600);
  CHECK(cfg.remote.connection == "redis://cache:6380/1");
  CHECK(cfg.local.max_entries == 10000);
  CHECK(cfg.remote.timeout_ms == 75);
  CHECK(cfg.remote.connect_timeout_ms == 75);
  CHECK(cfg.remote.key_prefix == "svc:");
  CHECK(validate_config(cfg, &err));
  clear_env();
}

TEST_CASE("malformed environment leaves config unchanged", "[config][env]") {
  clear_env();
  setenv("TIERED_CACHE_LOCAL_TTL", "45", 1);
  setenv("TIERED_CACHE_REMOTE_TTL", "ten", 1);
  CacheConfig cfg;
  std::string err;
  CHECK_FALSE(load_config_from_env(cfg, &err));
  CHECK(err.find("TIERED_CACHE_REMOTE_TTL") != std::string::npos);
  CHECK(cfg.local.default_ttl_seconds == 300);

  clear_env();
  setenv("TIERED_CACHE_MAX_ENTRIES", "-1", 1);
  CHECK_FALSE(load_config_from_env(cfg, &err));
  clear_env();
}

TEST_CASE("config file reload is atomic", "[config][file]") {
  const char *path = "tiered_cache_test_config.json";
  write_file(path, R"({"local_ttl":120,"remote_url":"redis://r1:6379",)"
                   R"("max_entries":500,"pool_size":8,"key_prefix":"a:"})");
  CacheConfig cfg;
  std::string err;
  REQUIRE(load_config_file(path, cfg, &err));
  CHECK(cfg.local.default_ttl_seconds == 120);
  CHECK(cfg.remote.connection == "redis://r1:6379");
  CHECK(cfg.local.max_entries == 500);
  CHECK(cfg.remote.pool_size == 8);
  CHECK(cfg.remote.key_prefix == "a:");

  write_file(path, R"({"local_ttl":30,"pool_size":"many"})");
  CHECK_FALSE(load_config_file(path, cfg, &err));
  CHECK(err == "invalid integer for pool_size");
  CHECK(cfg.local.default_ttl_seconds == 120);

  write_file(path, R"({"remote_timeout_ms":0})");
  CHECK_FALSE(load_config_file(path, cfg, &err));

  write_file(path, "local_ttl=5");
  CHECK_FALSE(load_config_file(path, cfg, &err));
  CHECK(err == "invalid schema");

  CHECK_FALSE(load_config_file("does/not/exist.json", cfg, &err));
  CHECK(err.find("not found") != std::string::npos);
  std::remove(path);
}

TEST_CASE("validation rejects unusable settings", "[config]") {
  std::string err;
  CacheConfig cfg;
  cfg.local.default_ttl_seconds = 0;
  CHECK_FALSE(validate_config(cfg, &err));
  CHECK(err.find("local") != std::string::npos);

  cfg = {};
  cfg.remote.default_ttl_seconds = -5;
  CHECK_FALSE(validate_config(cfg, &err));

  cfg = {};
  cfg.remote.pool_size = 0;
  CHECK_FALSE(validate_config(cfg, &err));

  cfg = {};
  cfg.remote.connection = "memcached://host";
  CHECK_FALSE(validate_config(cfg, &err));
  CHECK(err.find("remote connection") != std::string::npos);
}
