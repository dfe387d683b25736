#pragma once

#include "tiered_cache/cache.hpp"
#include "tiered_cache/resp.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tiered_cache {

struct ConnectionOptions {
  std::string host{"127.0.0.1"};
  int port{6379};
  std::string user;
  std::string password;
  int db{0};
};

// Accepts redis://[[user]:password@]host[:port][/db], tcp://host[:port] and
// bare host[:port].
bool parse_connection_string(const std::string &text, ConnectionOptions &out,
                             std::string *err = nullptr);

struct RemoteCacheConfig {
  std::string connection{"redis://127.0.0.1:6379"};
  std::int64_t default_ttl_seconds{3600};
  std::uint64_t timeout_ms{250};
  std::uint64_t connect_timeout_ms{250};
  std::size_t pool_size{4};
  std::uint64_t reconnect_backoff_ms{1000};
  std::size_t max_key_len{512};
  std::size_t max_value_bytes{512 * 1024 * 1024 - 64};
  std::string key_prefix;
  bool log_errors{true};
};

// Decoded form of the record stored on the backend.
struct RemoteRecord {
  Bytes value;
  std::int64_t created_at_ms{0};
  std::uint32_t ttl_seconds{0};
};

bool encode_record(const Bytes &value, std::int64_t created_at_ms,
                   std::uint32_t ttl_seconds, std::string &out,
                   std::string *err = nullptr);
bool decode_record(const std::string &raw, RemoteRecord &out,
                   std::string *err = nullptr);

// One TCP session to the backend. Owns its socket.
class RespConnection {
public:
  RespConnection(int fd, std::uint64_t timeout_ms);
  ~RespConnection();

  RespConnection(const RespConnection &) = delete;
  RespConnection &operator=(const RespConnection &) = delete;

  static std::unique_ptr<RespConnection>
  open(const ConnectionOptions &opts, std::uint64_t connect_timeout_ms,
       std::uint64_t timeout_ms, std::string *err);

  std::optional<RespReply> request(const std::vector<std::string> &args,
                                   std::string *err);
  bool timed_out() const { return timed_out_; }

private:
  bool send_all(const std::string &data,
                std::chrono::steady_clock::time_point deadline,
                std::string *err);

  int fd_;
  std::uint64_t timeout_ms_;
  bool timed_out_{false};
  RespReplyReader reader_;
};

// Network-backed cache tier. Every failure caused by the network is reported
// as ErrorCode::BackendUnavailable and counted; nothing is thrown.
class RemoteCacheClient final : public ICache {
public:
  explicit RemoteCacheClient(RemoteCacheConfig cfg);
  ~RemoteCacheClient() override;

  RemoteCacheClient(const RemoteCacheClient &) = delete;
  RemoteCacheClient &operator=(const RemoteCacheClient &) = delete;

  std::string name() const override { return "remote"; }

  std::optional<Bytes> get(const std::string &key,
                           Error *err = nullptr) override;
  bool put(const std::string &key, const Bytes &value,
           std::optional<std::int64_t> ttl_seconds = std::nullopt,
           Error *err = nullptr) override;
  bool del(const std::string &key, Error *err = nullptr) override;
  bool exists(const std::string &key, Error *err = nullptr) override;
  void clear() override;
  CacheStats stats() const override;

  std::optional<RemoteRecord> get_record(const std::string &key,
                                         Error *err = nullptr);
  bool ping(Error *err = nullptr);

  std::int64_t default_ttl_seconds() const { return cfg_.default_ttl_seconds; }
  const ConnectionOptions &connection() const { return conn_opts_; }
  std::size_t idle_connections() const;

private:
  std::optional<RespReply> execute(const std::vector<std::string> &args,
                                   Error *err);
  std::unique_ptr<RespConnection> acquire(Error *err, bool *reused);
  void release(std::unique_ptr<RespConnection> conn);
  bool valid_key(const std::string &key) const;
  std::string wire_key(const std::string &key) const;
  void record_failure(const char *op, const std::string &key,
                      const Error &err) const;
  void forget(const std::string &key);
  void prune_written_locked(std::chrono::steady_clock::time_point now) const;

  RemoteCacheConfig cfg_;
  ConnectionOptions conn_opts_;
  bool conn_opts_valid_{false};
  std::string conn_opts_error_;

  mutable std::mutex pool_mu_;
  std::vector<std::unique_ptr<RespConnection>> idle_;
  std::chrono::steady_clock::time_point down_until_{};

  // Keys this client wrote, with the TTL and the moment the backend drops
  // them. Expired keys are pruned lazily.
  struct Written {
    std::int64_t ttl_seconds;
    std::chrono::steady_clock::time_point expires_at;
  };
  static constexpr std::size_t kMinPruneAt = 1024;
  mutable std::mutex written_mu_;
  mutable std::unordered_map<std::string, Written> written_;
  std::size_t prune_at_{kMinPruneAt};

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  mutable std::atomic<std::uint64_t> backend_errors_{0};
};

} // namespace tiered_cache
