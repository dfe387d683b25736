#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace tiered_cache {

// Canonical argument representation used to derive memoization keys. Every
// value is written with a type tag and, where the length varies, a length
// prefix, so 1, 1u, 1.0 and "1" never collide. Caller types provide
//   std::string cache_key_repr(const T &);
// found by argument-dependent lookup.

void append_repr(std::string &out, bool v);
void append_repr(std::string &out, long long v);
void append_repr(std::string &out, unsigned long long v);
void append_repr(std::string &out, double v);
void append_repr(std::string &out, std::string_view v);

template <typename T> void append_key_repr(std::string &out, const T &v);

namespace detail {

template <typename T> struct is_key_vector : std::false_type {};
template <typename T, typename A>
struct is_key_vector<std::vector<T, A>> : std::true_type {};

template <typename T> struct is_key_map : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct is_key_map<std::map<K, V, C, A>> : std::true_type {};

template <typename T> struct is_key_optional : std::false_type {};
template <typename T>
struct is_key_optional<std::optional<T>> : std::true_type {};

template <typename T> struct is_key_tuple : std::false_type {};
template <typename... Ts>
struct is_key_tuple<std::tuple<Ts...>> : std::true_type {};
template <typename A, typename B>
struct is_key_tuple<std::pair<A, B>> : std::true_type {};

} // namespace detail

template <typename T> void append_key_repr(std::string &out, const T &v) {
  using U = std::decay_t<T>;
  if constexpr (std::is_same_v<U, bool>) {
    append_repr(out, v);
  } else if constexpr (std::is_enum_v<U>) {
    out += 'e';
    append_key_repr(out, static_cast<std::underlying_type_t<U>>(v));
  } else if constexpr (std::is_integral_v<U> && std::is_signed_v<U>) {
    append_repr(out, static_cast<long long>(v));
  } else if constexpr (std::is_integral_v<U>) {
    append_repr(out, static_cast<unsigned long long>(v));
  } else if constexpr (std::is_floating_point_v<U>) {
    append_repr(out, static_cast<double>(v));
  } else if constexpr (std::is_convertible_v<const U &, std::string_view>) {
    append_repr(out, std::string_view(v));
  } else if constexpr (detail::is_key_vector<U>::value) {
    out += "v" + std::to_string(v.size()) + "[";
    for (const auto &item : v)
      append_key_repr(out, item);
    out += "]";
  } else if constexpr (detail::is_key_map<U>::value) {
    out += "m" + std::to_string(v.size()) + "{";
    for (const auto &[k, item] : v) {
      append_key_repr(out, k);
      append_key_repr(out, item);
    }
    out += "}";
  } else if constexpr (detail::is_key_optional<U>::value) {
    if (!v.has_value()) {
      out += "n;";
    } else {
      out += "o";
      append_key_repr(out, *v);
    }
  } else if constexpr (detail::is_key_tuple<U>::value) {
    out += "t" + std::to_string(std::tuple_size_v<U>) + "(";
    std::apply([&out](const auto &...items) { (append_key_repr(out, items), ...); },
               v);
    out += ")";
  } else {
    const std::string custom = cache_key_repr(v);
    out += "c" + std::to_string(custom.size()) + ":" + custom;
  }
}

template <typename... Args> std::string key_repr(const Args &...args) {
  std::string out;
  out += "a" + std::to_string(sizeof...(Args)) + "|";
  (append_key_repr(out, args), ...);
  return out;
}

// "<prefix>:<name>:<16 hex digits of fnv1a64(repr)>"
std::string make_cache_key(const std::string &prefix, const std::string &name,
                           const std::string &repr);

} // namespace tiered_cache
