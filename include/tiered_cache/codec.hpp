#pragma once

#include "tiered_cache/types.hpp"

#include <bit>
#include <cstdint>
#include <cstring>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace tiered_cache {

std::uint32_t fnv1a32(const std::uint8_t *data, std::size_t len,
                      std::uint32_t seed = 2166136261u);
std::uint64_t fnv1a64(const std::string &data);
std::string fnv1a64_hex(const std::string &data);

// Little-endian byte sink used by the value codec and the remote envelope.
class ByteWriter {
public:
  void put_u8(std::uint8_t v) { out_.push_back(v); }
  void put_u32(std::uint32_t v);
  void put_u64(std::uint64_t v);
  void put_i64(std::int64_t v) { put_u64(static_cast<std::uint64_t>(v)); }
  void put_raw(const void *data, std::size_t len);
  // u32 length prefix followed by the bytes; fails above UINT32_MAX.
  bool put_blob(const void *data, std::size_t len);
  bool put_length(std::size_t len);

  Bytes &bytes() { return out_; }
  Bytes take() { return std::move(out_); }

private:
  Bytes out_;
};

class ByteReader {
public:
  ByteReader(const std::uint8_t *data, std::size_t len)
      : data_(data), len_(len) {}
  explicit ByteReader(const Bytes &b) : ByteReader(b.data(), b.size()) {}

  bool get_u8(std::uint8_t &v);
  bool get_u32(std::uint32_t &v);
  bool get_u64(std::uint64_t &v);
  bool get_i64(std::int64_t &v);
  bool get_raw(void *out, std::size_t len);
  bool get_length(std::size_t &len);
  bool get_string(std::string &out);

  std::size_t remaining() const { return len_ - pos_; }
  bool done() const { return pos_ == len_; }
  const std::uint8_t *cursor() const { return data_ + pos_; }
  bool skip(std::size_t n);

private:
  const std::uint8_t *data_;
  std::size_t len_;
  std::size_t pos_{0};
};

// Specialize for caller-defined value types:
//   static bool encode(ByteWriter &, const T &);
//   static bool decode(ByteReader &, T &);
template <typename T, typename Enable = void> struct Codec;

namespace detail {

template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T> struct is_map : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_pair : std::false_type {};
template <typename A, typename B>
struct is_pair<std::pair<A, B>> : std::true_type {};

template <typename T> bool write(ByteWriter &w, const T &v);
template <typename T> bool read(ByteReader &r, T &v);

template <typename T> bool write(ByteWriter &w, const T &v) {
  if constexpr (std::is_same_v<T, bool>) {
    w.put_u8(v ? 1 : 0);
    return true;
  } else if constexpr (std::is_enum_v<T>) {
    return write(w, static_cast<std::underlying_type_t<T>>(v));
  } else if constexpr (std::is_integral_v<T>) {
    if constexpr (std::is_signed_v<T>)
      w.put_i64(static_cast<std::int64_t>(v));
    else
      w.put_u64(static_cast<std::uint64_t>(v));
    return true;
  } else if constexpr (std::is_same_v<T, double>) {
    w.put_u64(std::bit_cast<std::uint64_t>(v));
    return true;
  } else if constexpr (std::is_same_v<T, float>) {
    w.put_u32(std::bit_cast<std::uint32_t>(v));
    return true;
  } else if constexpr (std::is_same_v<T, std::string>) {
    return w.put_blob(v.data(), v.size());
  } else if constexpr (is_vector<T>::value) {
    if (!w.put_length(v.size()))
      return false;
    for (const auto &item : v)
      if (!write(w, item))
        return false;
    return true;
  } else if constexpr (is_map<T>::value) {
    if (!w.put_length(v.size()))
      return false;
    for (const auto &[k, item] : v)
      if (!write(w, k) || !write(w, item))
        return false;
    return true;
  } else if constexpr (is_optional<T>::value) {
    w.put_u8(v.has_value() ? 1 : 0);
    return !v.has_value() || write(w, *v);
  } else if constexpr (is_pair<T>::value) {
    return write(w, v.first) && write(w, v.second);
  } else {
    return Codec<T>::encode(w, v);
  }
}

template <typename T> bool read(ByteReader &r, T &v) {
  if constexpr (std::is_same_v<T, bool>) {
    std::uint8_t b = 0;
    if (!r.get_u8(b) || b > 1)
      return false;
    v = b == 1;
    return true;
  } else if constexpr (std::is_enum_v<T>) {
    std::underlying_type_t<T> raw{};
    if (!read(r, raw))
      return false;
    v = static_cast<T>(raw);
    return true;
  } else if constexpr (std::is_integral_v<T>) {
    if constexpr (std::is_signed_v<T>) {
      std::int64_t raw = 0;
      if (!r.get_i64(raw) || raw < std::numeric_limits<T>::min() ||
          raw > std::numeric_limits<T>::max())
        return false;
      v = static_cast<T>(raw);
    } else {
      std::uint64_t raw = 0;
      if (!r.get_u64(raw) || raw > std::numeric_limits<T>::max())
        return false;
      v = static_cast<T>(raw);
    }
    return true;
  } else if constexpr (std::is_same_v<T, double>) {
    std::uint64_t raw = 0;
    if (!r.get_u64(raw))
      return false;
    v = std::bit_cast<double>(raw);
    return true;
  } else if constexpr (std::is_same_v<T, float>) {
    std::uint32_t raw = 0;
    if (!r.get_u32(raw))
      return false;
    v = std::bit_cast<float>(raw);
    return true;
  } else if constexpr (std::is_same_v<T, std::string>) {
    return r.get_string(v);
  } else if constexpr (is_vector<T>::value) {
    std::size_t n = 0;
    if (!r.get_length(n))
      return false;
    v.clear();
    // Every element costs at least one byte; rejects absurd counts early.
    if (n > r.remaining())
      return false;
    v.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      typename T::value_type item{};
      if (!read(r, item))
        return false;
      v.push_back(std::move(item));
    }
    return true;
  } else if constexpr (is_map<T>::value) {
    std::size_t n = 0;
    if (!r.get_length(n) || n > r.remaining())
      return false;
    v.clear();
    for (std::size_t i = 0; i < n; ++i) {
      typename T::key_type k{};
      typename T::mapped_type item{};
      if (!read(r, k) || !read(r, item))
        return false;
      v.emplace(std::move(k), std::move(item));
    }
    return true;
  } else if constexpr (is_optional<T>::value) {
    std::uint8_t present = 0;
    if (!r.get_u8(present) || present > 1)
      return false;
    if (!present) {
      v.reset();
      return true;
    }
    typename T::value_type inner{};
    if (!read(r, inner))
      return false;
    v = std::move(inner);
    return true;
  } else if constexpr (is_pair<T>::value) {
    return read(r, v.first) && read(r, v.second);
  } else {
    return Codec<T>::decode(r, v);
  }
}

} // namespace detail

inline constexpr std::uint8_t kValueMagic = 0xC7;
inline constexpr std::uint8_t kValueFormatVersion = 1;

template <typename T>
bool encode_value(const T &value, Bytes &out, std::string *err = nullptr) {
  ByteWriter w;
  w.put_u8(kValueMagic);
  w.put_u8(kValueFormatVersion);
  if (!detail::write(w, value)) {
    if (err)
      *err = "value not encodable";
    return false;
  }
  out = w.take();
  return true;
}

template <typename T>
bool decode_value(const Bytes &in, T &out, std::string *err = nullptr) {
  ByteReader r(in);
  std::uint8_t magic = 0;
  std::uint8_t version = 0;
  if (!r.get_u8(magic) || !r.get_u8(version) || magic != kValueMagic) {
    if (err)
      *err = "bad value header";
    return false;
  }
  if (version != kValueFormatVersion) {
    if (err)
      *err = "unsupported value format version " + std::to_string(version);
    return false;
  }
  T tmp{};
  if (!detail::read(r, tmp)) {
    if (err)
      *err = "truncated or mistyped value";
    return false;
  }
  if (!r.done()) {
    if (err)
      *err = "trailing bytes after value";
    return false;
  }
  out = std::move(tmp);
  return true;
}

} // namespace tiered_cache
