#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tiered_cache::testing {

// One decoded client request. A framing error yields malformed == true and
// the offending line is skipped.
struct Request {
  std::vector<std::string> args;
  bool malformed{false};
};

// Incremental decoder for RESP request arrays, the server side of the
// protocol spoken by RemoteCacheClient.
class RequestDecoder {
public:
  void feed(const char *data, std::size_t len) { buffer_.append(data, len); }
  void feed(const std::string &data) { buffer_ += data; }
  std::optional<Request> next();

private:
  bool take_bulk(std::size_t &pos, std::string &out) const;
  std::optional<Request> skip_line();

  std::string buffer_;
};

std::string reply_simple(const std::string &s);
std::string reply_error(const std::string &message);
std::string reply_integer(long long v);
std::string reply_bulk(const std::string &s);
std::string reply_nil();
std::string reply_array(const std::vector<std::string> &encoded_items);

} // namespace tiered_cache::testing
