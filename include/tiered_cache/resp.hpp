#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tiered_cache {

struct RespReply {
  enum class Type { Simple, Error, Integer, Bulk, Nil, Array };

  Type type{Type::Nil};
  std::string str;
  long long integer{0};
  std::vector<RespReply> elements;

  bool is_ok() const { return type == Type::Simple && str == "OK"; }
  bool is_error() const { return type == Type::Error; }
};

// Incremental parser for RESP replies (client side). A reply that violates
// the protocol puts the reader into a sticky failed state.
class RespReplyReader {
public:
  void feed(const char* data, std::size_t len);
  std::optional<RespReply> next_reply();
  bool failed() const { return failed_; }
  void reset();

private:
  enum class Parse { Done, Incomplete, Malformed };
  Parse parse(std::size_t& pos, RespReply& out, int depth) const;
  bool read_line(std::size_t& pos, std::string& line, bool& complete) const;

  std::string buffer_;
  bool failed_{false};
};

// Encodes a client command as a RESP array of bulk strings.
std::string resp_command(const std::vector<std::string>& args);

} // namespace tiered_cache
