#pragma once

#include "tiered_cache/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tiered_cache {

// Uniform get/put/delete contract shared by every cache tier. Failures are
// reported through the optional Error out-parameter; see ErrorCode.
class ICache {
public:
  virtual ~ICache() = default;
  virtual std::string name() const = 0;

  virtual std::optional<Bytes> get(const std::string &key,
                                   Error *err = nullptr) = 0;
  // An empty ttl_seconds selects the tier's configured default.
  virtual bool put(const std::string &key, const Bytes &value,
                   std::optional<std::int64_t> ttl_seconds = std::nullopt,
                   Error *err = nullptr) = 0;
  virtual bool del(const std::string &key, Error *err = nullptr) = 0;
  virtual bool exists(const std::string &key, Error *err = nullptr) = 0;
  virtual void clear() = 0;
  virtual CacheStats stats() const = 0;
};

} // namespace tiered_cache
