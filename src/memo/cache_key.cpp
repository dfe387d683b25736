#include "tiered_cache/cache_key.hpp"
#include "tiered_cache/codec.hpp"

#include <cstdio>

namespace tiered_cache {

void append_repr(std::string &out, bool v) { out += v ? "b1;" : "b0;"; }

void append_repr(std::string &out, long long v) {
  out += "i" + std::to_string(v) + ";";
}

void append_repr(std::string &out, unsigned long long v) {
  out += "u" + std::to_string(v) + ";";
}

void append_repr(std::string &out, double v) {
  // Hex-float text is exact and locale independent.
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%a", v);
  out += "f";
  out += buf;
  out += ";";
}

void append_repr(std::string &out, std::string_view v) {
  out += "s" + std::to_string(v.size()) + ":";
  out.append(v.data(), v.size());
}

std::string make_cache_key(const std::string &prefix, const std::string &name,
                           const std::string &repr) {
  std::string key;
  key.reserve(prefix.size() + name.size() + 18);
  if (!prefix.empty()) {
    key += prefix;
    key += ':';
  }
  key += name;
  key += ':';
  key += fnv1a64_hex(repr);
  return key;
}

} // namespace tiered_cache
