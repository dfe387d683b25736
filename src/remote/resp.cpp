#include "tiered_cache/resp.hpp"

#include <charconv>

namespace tiered_cache {
namespace {
constexpr long long kMaxBulkLen = 512LL * 1024 * 1024;
constexpr long long kMaxArrayLen = 1024 * 1024;
constexpr int kMaxDepth = 8;

bool parse_int(const std::string& s, std::size_t from, std::size_t to,
               long long& out) {
  if (from >= to) return false;
  const char* first = s.data() + from;
  const char* last = s.data() + to;
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}
} // namespace

void RespReplyReader::feed(const char* data, std::size_t len) {
  buffer_.append(data, len);
}

void RespReplyReader::reset() {
  buffer_.clear();
  failed_ = false;
}

std::optional<RespReply> RespReplyReader::next_reply() {
  if (failed_ || buffer_.empty()) return std::nullopt;
  std::size_t pos = 0;
  RespReply reply;
  switch (parse(pos, reply, 0)) {
  case Parse::Done:
    buffer_.erase(0, pos);
    return reply;
  case Parse::Malformed:
    failed_ = true;
    return std::nullopt;
  case Parse::Incomplete:
    break;
  }
  return std::nullopt;
}

bool RespReplyReader::read_line(std::size_t& pos, std::string& line,
                                bool& complete) const {
  auto crlf = buffer_.find("\r\n", pos);
  if (crlf == std::string::npos) {
    complete = false;
    return true;
  }
  complete = true;
  line = buffer_.substr(pos, crlf - pos);
  pos = crlf + 2;
  return line.find('\n') == std::string::npos;
}

RespReplyReader::Parse RespReplyReader::parse(std::size_t& pos, RespReply& out,
                                              int depth) const {
  if (depth > kMaxDepth) return Parse::Malformed;
  if (pos >= buffer_.size()) return Parse::Incomplete;
  const char tag = buffer_[pos];
  std::size_t cur = pos + 1;
  std::string line;
  bool complete = false;
  if (!read_line(cur, line, complete)) return Parse::Malformed;
  if (!complete) return Parse::Incomplete;

  switch (tag) {
  case '+':
    out.type = RespReply::Type::Simple;
    out.str = std::move(line);
    break;
  case '-':
    out.type = RespReply::Type::Error;
    out.str = std::move(line);
    break;
  case ':':
    out.type = RespReply::Type::Integer;
    if (!parse_int(line, 0, line.size(), out.integer)) return Parse::Malformed;
    break;
  case '$': {
    long long len = 0;
    if (!parse_int(line, 0, line.size(), len) || len < -1 || len > kMaxBulkLen)
      return Parse::Malformed;
    if (len == -1) {
      out.type = RespReply::Type::Nil;
      break;
    }
    const auto n = static_cast<std::size_t>(len);
    if (cur + n + 2 > buffer_.size()) return Parse::Incomplete;
    if (buffer_.compare(cur + n, 2, "\r\n") != 0) return Parse::Malformed;
    out.type = RespReply::Type::Bulk;
    out.str = buffer_.substr(cur, n);
    cur += n + 2;
    break;
  }
  case '*': {
    long long n = 0;
    if (!parse_int(line, 0, line.size(), n) || n < -1 || n > kMaxArrayLen)
      return Parse::Malformed;
    if (n == -1) {
      out.type = RespReply::Type::Nil;
      break;
    }
    out.type = RespReply::Type::Array;
    out.elements.clear();
    out.elements.reserve(static_cast<std::size_t>(n));
    for (long long i = 0; i < n; ++i) {
      RespReply child;
      auto r = parse(cur, child, depth + 1);
      if (r != Parse::Done) return r;
      out.elements.push_back(std::move(child));
    }
    break;
  }
  default:
    return Parse::Malformed;
  }
  pos = cur;
  return Parse::Done;
}

std::string resp_command(const std::vector<std::string>& args) {
  std::string out = "*" + std::to_string(args.size()) + "\r\n";
  for (const auto& a : args)
    out += "$" + std::to_string(a.size()) + "\r\n" + a + "\r\n";
  return out;
}

} // namespace tiered_cache
