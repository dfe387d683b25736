#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tiered_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn = std::function<TimePoint()>;
using Bytes = std::vector<std::uint8_t>;

struct Entry {
  Bytes value;
  TimePoint created_at{};
  TimePoint expires_at{};
  TimePoint last_access{};
  std::uint64_t hit_count{0};
  std::int64_t ttl_seconds{0};

  bool live(TimePoint now) const { return now < expires_at; }
};

// start + ttl, saturating at TimePoint::max() instead of overflowing.
inline TimePoint expiry_after(TimePoint start, std::int64_t ttl_seconds) {
  const auto room = std::chrono::duration_cast<std::chrono::seconds>(
      TimePoint::max() - start);
  if (ttl_seconds >= room.count())
    return TimePoint::max();
  return start + std::chrono::seconds(ttl_seconds);
}

enum class ErrorCode {
  Ok,
  InvalidTtl,
  InvalidKey,
  Serialization,
  BackendUnavailable,
};

const char *to_string(ErrorCode code);

struct Error {
  ErrorCode code{ErrorCode::Ok};
  std::string message;

  bool ok() const { return code == ErrorCode::Ok; }
  // Soft errors degrade to a miss or an unconfirmed write.
  bool soft() const { return code == ErrorCode::BackendUnavailable; }
};

inline void set_error(Error *err, ErrorCode code, std::string message) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
  }
}

inline void clear_error(Error *err) {
  if (err) {
    err->code = ErrorCode::Ok;
    err->message.clear();
  }
}

class CacheError : public std::runtime_error {
public:
  CacheError(ErrorCode code, const std::string &message)
      : std::runtime_error(std::string(to_string(code)) + ": " + message),
        code_(code) {}
  explicit CacheError(const Error &err) : CacheError(err.code, err.message) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

struct CacheStats {
  std::size_t entry_count{0};
  std::uint64_t total_hits{0};
  double avg_ttl_seconds{0.0};
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t expirations{0};
  std::uint64_t evictions{0};
  std::uint64_t backend_errors{0};
};

} // namespace tiered_cache
