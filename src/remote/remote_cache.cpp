#include "tiered_cache/remote_cache.hpp"
#include "tiered_cache/codec.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <iostream>
#include <limits>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace tiered_cache {
namespace {
#pragma pack(push, 1)
struct RecordHeader {
  std::uint32_t magic;
  std::uint32_t checksum;
  std::int64_t created_at_ms;
  std::uint32_t ttl_seconds;
  std::uint32_t value_len;
};
#pragma pack(pop)

constexpr std::uint32_t kRecordMagic = 0x54435231; // TCR1
constexpr std::size_t kRecordHeaderSize = sizeof(RecordHeader);
constexpr std::size_t kClearBatch = 64;

std::uint32_t record_checksum(std::int64_t created_at_ms,
                              std::uint32_t ttl_seconds,
                              std::uint32_t value_len, const std::uint8_t *value,
                              std::size_t len) {
  ByteWriter w;
  w.put_i64(created_at_ms);
  w.put_u32(ttl_seconds);
  w.put_u32(value_len);
  auto sum = fnv1a32(w.bytes().data(), w.bytes().size());
  return fnv1a32(value, len, sum);
}

bool parse_number(const std::string &s, int &out) {
  if (s.empty())
    return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

std::int64_t epoch_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             Clock::now().time_since_epoch())
      .count();
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now())
                        .count();
  return left <= 0 ? 0 : static_cast<int>(std::min<long long>(left, 1 << 30));
}

std::mutex &log_mutex() {
  static std::mutex mu;
  return mu;
}
} // namespace

bool parse_connection_string(const std::string &text, ConnectionOptions &out,
                             std::string *err) {
  auto fail = [err](const std::string &msg) {
    if (err)
      *err = msg;
    return false;
  };
  ConnectionOptions opts;
  std::string rest = text;
  const auto scheme_end = rest.find("://");
  if (scheme_end != std::string::npos) {
    const auto scheme = rest.substr(0, scheme_end);
    if (scheme != "redis" && scheme != "tcp")
      return fail("unsupported scheme: " + scheme);
    rest = rest.substr(scheme_end + 3);
  }

  const auto slash = rest.find('/');
  if (slash != std::string::npos) {
    const auto db = rest.substr(slash + 1);
    if (!db.empty() && (!parse_number(db, opts.db) || opts.db < 0))
      return fail("invalid database index: " + db);
    rest = rest.substr(0, slash);
  }

  const auto at = rest.rfind('@');
  if (at != std::string::npos) {
    const auto userinfo = rest.substr(0, at);
    const auto colon = userinfo.find(':');
    if (colon == std::string::npos) {
      opts.user = userinfo;
    } else {
      opts.user = userinfo.substr(0, colon);
      opts.password = userinfo.substr(colon + 1);
    }
    rest = rest.substr(at + 1);
  }

  std::string port_text;
  if (!rest.empty() && rest.front() == '[') {
    const auto close = rest.find(']');
    if (close == std::string::npos)
      return fail("unterminated IPv6 address");
    opts.host = rest.substr(1, close - 1);
    if (close + 1 < rest.size()) {
      if (rest[close + 1] != ':')
        return fail("unexpected text after IPv6 address");
      port_text = rest.substr(close + 2);
    }
  } else {
    const auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
      opts.host = rest.substr(0, colon);
      port_text = rest.substr(colon + 1);
    } else {
      opts.host = rest;
    }
  }
  if (opts.host.empty())
    return fail("missing host");
  if (!port_text.empty() &&
      (!parse_number(port_text, opts.port) || opts.port <= 0 ||
       opts.port > 65535))
    return fail("invalid port: " + port_text);
  out = std::move(opts);
  return true;
}

bool encode_record(const Bytes &value, std::int64_t created_at_ms,
                   std::uint32_t ttl_seconds, std::string &out,
                   std::string *err) {
  if (value.size() > std::numeric_limits<std::uint32_t>::max()) {
    if (err)
      *err = "value too large for record";
    return false;
  }
  const auto len = static_cast<std::uint32_t>(value.size());
  ByteWriter w;
  w.put_u32(kRecordMagic);
  w.put_u32(record_checksum(created_at_ms, ttl_seconds, len, value.data(),
                            value.size()));
  w.put_i64(created_at_ms);
  w.put_u32(ttl_seconds);
  w.put_u32(len);
  w.put_raw(value.data(), value.size());
  const auto &b = w.bytes();
  out.assign(reinterpret_cast<const char *>(b.data()), b.size());
  return true;
}

bool decode_record(const std::string &raw, RemoteRecord &out,
                   std::string *err) {
  auto fail = [err](const char *msg) {
    if (err)
      *err = msg;
    return false;
  };
  if (raw.size() < kRecordHeaderSize)
    return fail("record shorter than header");
  ByteReader r(reinterpret_cast<const std::uint8_t *>(raw.data()), raw.size());
  std::uint32_t magic = 0;
  std::uint32_t checksum = 0;
  RemoteRecord rec;
  std::uint32_t len = 0;
  if (!r.get_u32(magic) || !r.get_u32(checksum) ||
      !r.get_i64(rec.created_at_ms) || !r.get_u32(rec.ttl_seconds) ||
      !r.get_u32(len))
    return fail("record shorter than header");
  if (magic != kRecordMagic)
    return fail("bad record magic");
  if (r.remaining() != len)
    return fail("record length mismatch");
  if (record_checksum(rec.created_at_ms, rec.ttl_seconds, len, r.cursor(),
                      len) != checksum)
    return fail("record checksum mismatch");
  rec.value.assign(r.cursor(), r.cursor() + len);
  out = std::move(rec);
  return true;
}

RespConnection::RespConnection(int fd, std::uint64_t timeout_ms)
    : fd_(fd), timeout_ms_(timeout_ms) {}

RespConnection::~RespConnection() {
  if (fd_ >= 0)
    ::close(fd_);
}

std::unique_ptr<RespConnection>
RespConnection::open(const ConnectionOptions &opts,
                     std::uint64_t connect_timeout_ms, std::uint64_t timeout_ms,
                     std::string *err) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *res = nullptr;
  const auto port = std::to_string(opts.port);
  const int rc = ::getaddrinfo(opts.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    if (err)
      *err = std::string("resolve failed: ") + gai_strerror(rc);
    return nullptr;
  }

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(connect_timeout_ms);
  std::string last_error = "no usable address";
  int fd = -1;
  for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC,
                  ai->ai_protocol);
    if (fd < 0) {
      last_error = std::string("socket: ") + std::strerror(errno);
      continue;
    }
    ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL, 0) | O_NONBLOCK);
    int ok = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (ok < 0 && errno == EINPROGRESS) {
      pollfd pfd{fd, POLLOUT, 0};
      const int n = ::poll(&pfd, 1, remaining_ms(deadline));
      if (n == 0) {
        last_error = "connect timed out";
        ok = -1;
      } else if (n < 0) {
        last_error = std::string("poll: ") + std::strerror(errno);
        ok = -1;
      } else {
        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len);
        ok = so_error == 0 ? 0 : -1;
        if (so_error != 0)
          last_error = std::string("connect: ") + std::strerror(so_error);
      }
    } else if (ok < 0) {
      last_error = std::string("connect: ") + std::strerror(errno);
    }
    if (ok == 0)
      break;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(res);
  if (fd < 0) {
    if (err)
      *err = last_error;
    return nullptr;
  }
  int one = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
  return std::make_unique<RespConnection>(fd, timeout_ms);
}

bool RespConnection::send_all(const std::string &data,
                              std::chrono::steady_clock::time_point deadline,
                              std::string *err) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t w =
        ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (w > 0) {
      sent += static_cast<std::size_t>(w);
      continue;
    }
    if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      if (err)
        *err = std::string("send: ") + std::strerror(errno);
      return false;
    }
    pollfd pfd{fd_, POLLOUT, 0};
    if (::poll(&pfd, 1, remaining_ms(deadline)) <= 0) {
      timed_out_ = true;
      if (err)
        *err = "send timed out";
      return false;
    }
  }
  return true;
}

std::optional<RespReply>
RespConnection::request(const std::vector<std::string> &args,
                        std::string *err) {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms_);
  timed_out_ = false;
  if (!send_all(resp_command(args), deadline, err))
    return std::nullopt;

  char buf[16384];
  while (true) {
    if (auto reply = reader_.next_reply())
      return reply;
    if (reader_.failed()) {
      if (err)
        *err = "protocol error in reply";
      return std::nullopt;
    }
    pollfd pfd{fd_, POLLIN, 0};
    const int n = ::poll(&pfd, 1, remaining_ms(deadline));
    if (n == 0) {
      timed_out_ = true;
      if (err)
        *err = "request timed out";
      return std::nullopt;
    }
    if (n < 0) {
      if (errno == EINTR)
        continue;
      if (err)
        *err = std::string("poll: ") + std::strerror(errno);
      return std::nullopt;
    }
    const ssize_t r = ::recv(fd_, buf, sizeof(buf), 0);
    if (r == 0) {
      if (err)
        *err = "connection closed by peer";
      return std::nullopt;
    }
    if (r < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        continue;
      if (err)
        *err = std::string("recv: ") + std::strerror(errno);
      return std::nullopt;
    }
    reader_.feed(buf, static_cast<std::size_t>(r));
  }
}

RemoteCacheClient::RemoteCacheClient(RemoteCacheConfig cfg)
    : cfg_(std::move(cfg)) {
  conn_opts_valid_ =
      parse_connection_string(cfg_.connection, conn_opts_, &conn_opts_error_);
}

RemoteCacheClient::~RemoteCacheClient() = default;

bool RemoteCacheClient::valid_key(const std::string &key) const {
  return !key.empty() && key.size() <= cfg_.max_key_len;
}

std::string RemoteCacheClient::wire_key(const std::string &key) const {
  return cfg_.key_prefix + key;
}

void RemoteCacheClient::record_failure(const char *op, const std::string &key,
                                       const Error &err) const {
  if (err.code == ErrorCode::BackendUnavailable)
    ++backend_errors_;
  if (!cfg_.log_errors)
    return;
  std::lock_guard<std::mutex> lock(log_mutex());
  std::cerr << "tiered_cache: remote " << op << " " << key << ": "
            << to_string(err.code) << ": " << err.message << "\n";
}

std::unique_ptr<RespConnection> RemoteCacheClient::acquire(Error *err,
                                                           bool *reused) {
  *reused = false;
  {
    std::lock_guard<std::mutex> lock(pool_mu_);
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      *reused = true;
      return conn;
    }
    if (std::chrono::steady_clock::now() < down_until_) {
      set_error(err, ErrorCode::BackendUnavailable, "backend marked down");
      return nullptr;
    }
  }
  if (!conn_opts_valid_) {
    set_error(err, ErrorCode::BackendUnavailable,
              "bad connection string: " + conn_opts_error_);
    return nullptr;
  }

  std::string msg;
  auto conn = RespConnection::open(conn_opts_, cfg_.connect_timeout_ms,
                                   cfg_.timeout_ms, &msg);
  std::optional<RespReply> reply;
  if (conn && !conn_opts_.password.empty()) {
    std::vector<std::string> auth{"AUTH"};
    if (!conn_opts_.user.empty())
      auth.push_back(conn_opts_.user);
    auth.push_back(conn_opts_.password);
    reply = conn->request(auth, &msg);
    if (!reply || !reply->is_ok()) {
      if (reply)
        msg = "AUTH rejected: " + reply->str;
      conn.reset();
    }
  }
  if (conn && conn_opts_.db != 0) {
    reply = conn->request({"SELECT", std::to_string(conn_opts_.db)}, &msg);
    if (!reply || !reply->is_ok()) {
      if (reply)
        msg = "SELECT rejected: " + reply->str;
      conn.reset();
    }
  }
  if (!conn) {
    std::lock_guard<std::mutex> lock(pool_mu_);
    down_until_ = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(cfg_.reconnect_backoff_ms);
    set_error(err, ErrorCode::BackendUnavailable, msg);
    return nullptr;
  }
  return conn;
}

void RemoteCacheClient::release(std::unique_ptr<RespConnection> conn) {
  std::lock_guard<std::mutex> lock(pool_mu_);
  if (idle_.size() < cfg_.pool_size)
    idle_.push_back(std::move(conn));
}

std::size_t RemoteCacheClient::idle_connections() const {
  std::lock_guard<std::mutex> lock(pool_mu_);
  return idle_.size();
}

std::optional<RespReply>
RemoteCacheClient::execute(const std::vector<std::string> &args, Error *err) {
  bool reused = false;
  auto conn = acquire(err, &reused);
  if (!conn)
    return std::nullopt;
  std::string msg;
  auto reply = conn->request(args, &msg);
  // A pooled session may have been closed by the server while idle; the
  // commands issued here are idempotent, so one retry on a fresh one is safe.
  if (!reply && reused && !conn->timed_out()) {
    conn = acquire(err, &reused);
    if (!conn)
      return std::nullopt;
    reply = conn->request(args, &msg);
  }
  if (!reply) {
    // The session state is unknown after a failed exchange; drop it.
    set_error(err, ErrorCode::BackendUnavailable, msg);
    return std::nullopt;
  }
  release(std::move(conn));
  if (reply->is_error()) {
    set_error(err, ErrorCode::BackendUnavailable,
              "server error: " + reply->str);
    return std::nullopt;
  }
  return reply;
}

std::optional<RemoteRecord>
RemoteCacheClient::get_record(const std::string &key, Error *err) {
  clear_error(err);
  if (!valid_key(key)) {
    ++misses_;
    return std::nullopt;
  }
  Error e;
  auto reply = execute({"GET", wire_key(key)}, &e);
  if (reply && reply->type == RespReply::Type::Nil) {
    ++misses_;
    forget(key);
    return std::nullopt;
  }
  if (reply && reply->type != RespReply::Type::Bulk)
    e = {ErrorCode::BackendUnavailable, "unexpected reply type to GET"};
  if (e.ok()) {
    RemoteRecord rec;
    std::string msg;
    if (decode_record(reply->str, rec, &msg)) {
      ++hits_;
      return rec;
    }
    e = {ErrorCode::Serialization, msg};
  }
  ++misses_;
  record_failure("get", key, e);
  if (err)
    *err = std::move(e);
  return std::nullopt;
}

std::optional<Bytes> RemoteCacheClient::get(const std::string &key,
                                            Error *err) {
  auto rec = get_record(key, err);
  if (!rec)
    return std::nullopt;
  return std::move(rec->value);
}

bool RemoteCacheClient::put(const std::string &key, const Bytes &value,
                            std::optional<std::int64_t> ttl_seconds,
                            Error *err) {
  clear_error(err);
  if (!valid_key(key)) {
    set_error(err, ErrorCode::InvalidKey, "invalid key length");
    return false;
  }
  const std::int64_t ttl = ttl_seconds.value_or(cfg_.default_ttl_seconds);
  if (ttl <= 0 || ttl > std::numeric_limits<std::uint32_t>::max()) {
    set_error(err, ErrorCode::InvalidTtl,
              "ttl out of range: " + std::to_string(ttl));
    return false;
  }
  if (value.size() > cfg_.max_value_bytes) {
    set_error(err, ErrorCode::Serialization,
              "value of " + std::to_string(value.size()) +
                  " bytes exceeds max_value_bytes");
    return false;
  }
  std::string raw;
  std::string msg;
  if (!encode_record(value, epoch_ms(), static_cast<std::uint32_t>(ttl), raw,
                     &msg)) {
    set_error(err, ErrorCode::Serialization, msg);
    return false;
  }

  Error e;
  auto reply = execute({"SETEX", wire_key(key), std::to_string(ttl), raw}, &e);
  if (reply && !reply->is_ok())
    e = {ErrorCode::BackendUnavailable, "unexpected reply to SETEX"};
  if (!e.ok()) {
    record_failure("put", key, e);
    if (err)
      *err = std::move(e);
    return false;
  }
  const auto now = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(written_mu_);
  written_[key] = Written{ttl, now + std::chrono::seconds(ttl)};
  if (written_.size() >= prune_at_) {
    prune_written_locked(now);
    prune_at_ = std::max(kMinPruneAt, written_.size() * 2);
  }
  return true;
}

bool RemoteCacheClient::del(const std::string &key, Error *err) {
  clear_error(err);
  if (!valid_key(key))
    return false;
  Error e;
  auto reply = execute({"DEL", wire_key(key)}, &e);
  if (reply && reply->type != RespReply::Type::Integer)
    e = {ErrorCode::BackendUnavailable, "unexpected reply type to DEL"};
  if (!e.ok()) {
    record_failure("del", key, e);
    if (err)
      *err = std::move(e);
    return false;
  }
  forget(key);
  return reply->integer > 0;
}

bool RemoteCacheClient::exists(const std::string &key, Error *err) {
  clear_error(err);
  if (!valid_key(key))
    return false;
  Error e;
  auto reply = execute({"EXISTS", wire_key(key)}, &e);
  if (reply && reply->type != RespReply::Type::Integer)
    e = {ErrorCode::BackendUnavailable, "unexpected reply type to EXISTS"};
  if (!e.ok()) {
    record_failure("exists", key, e);
    if (err)
      *err = std::move(e);
    return false;
  }
  if (reply->integer == 0)
    forget(key);
  return reply->integer > 0;
}

void RemoteCacheClient::forget(const std::string &key) {
  std::lock_guard<std::mutex> lock(written_mu_);
  written_.erase(key);
}

void RemoteCacheClient::prune_written_locked(
    std::chrono::steady_clock::time_point now) const {
  for (auto it = written_.begin(); it != written_.end();) {
    if (it->second.expires_at <= now)
      it = written_.erase(it);
    else
      ++it;
  }
}

void RemoteCacheClient::clear() {
  std::vector<std::string> keys;
  {
    std::lock_guard<std::mutex> lock(written_mu_);
    prune_written_locked(std::chrono::steady_clock::now());
    keys.reserve(written_.size());
    for (const auto &[k, w] : written_)
      keys.push_back(k);
  }
  for (std::size_t i = 0; i < keys.size(); i += kClearBatch) {
    const auto end = std::min(keys.size(), i + kClearBatch);
    std::vector<std::string> args{"DEL"};
    for (std::size_t j = i; j < end; ++j)
      args.push_back(wire_key(keys[j]));
    Error e;
    if (!execute(args, &e)) {
      record_failure("clear", keys[i], e);
      return;
    }
    std::lock_guard<std::mutex> lock(written_mu_);
    for (std::size_t j = i; j < end; ++j)
      written_.erase(keys[j]);
  }
}

bool RemoteCacheClient::ping(Error *err) {
  clear_error(err);
  Error e;
  auto reply = execute({"PING"}, &e);
  if (reply && !(reply->type == RespReply::Type::Simple && reply->str == "PONG"))
    e = {ErrorCode::BackendUnavailable, "unexpected reply to PING"};
  if (!e.ok()) {
    record_failure("ping", "-", e);
    if (err)
      *err = std::move(e);
    return false;
  }
  return true;
}

CacheStats RemoteCacheClient::stats() const {
  CacheStats s;
  s.hits = hits_.load();
  s.total_hits = s.hits;
  s.misses = misses_.load();
  s.backend_errors = backend_errors_.load();
  std::lock_guard<std::mutex> lock(written_mu_);
  prune_written_locked(std::chrono::steady_clock::now());
  s.entry_count = written_.size();
  std::int64_t ttl_sum = 0;
  for (const auto &[k, w] : written_)
    ttl_sum += w.ttl_seconds;
  if (!written_.empty())
    s.avg_ttl_seconds =
        static_cast<double>(ttl_sum) / static_cast<double>(written_.size());
  return s;
}

} // namespace tiered_cache
