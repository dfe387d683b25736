#include "tiered_cache/codec.hpp"

#include <cstdio>

namespace tiered_cache {

std::uint32_t fnv1a32(const std::uint8_t *data, std::size_t len,
                      std::uint32_t seed) {
  std::uint32_t h = seed;
  for (std::size_t i = 0; i < len; ++i) {
    h ^= data[i];
    h *= 16777619u;
  }
  return h;
}

std::uint64_t fnv1a64(const std::string &data) {
  std::uint64_t h = 1469598103934665603ULL;
  for (unsigned char c : data) {
    h ^= static_cast<std::uint64_t>(c);
    h *= 1099511628211ULL;
  }
  return h;
}

std::string fnv1a64_hex(const std::string &data) {
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx",
                static_cast<unsigned long long>(fnv1a64(data)));
  return std::string(buf, 16);
}

void ByteWriter::put_u32(std::uint32_t v) {
  for (int i = 0; i < 4; ++i)
    out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
}

void ByteWriter::put_u64(std::uint64_t v) {
  for (int i = 0; i < 8; ++i)
    out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
}

void ByteWriter::put_raw(const void *data, std::size_t len) {
  const auto *p = static_cast<const std::uint8_t *>(data);
  out_.insert(out_.end(), p, p + len);
}

bool ByteWriter::put_length(std::size_t len) {
  if (len > std::numeric_limits<std::uint32_t>::max())
    return false;
  put_u32(static_cast<std::uint32_t>(len));
  return true;
}

bool ByteWriter::put_blob(const void *data, std::size_t len) {
  if (!put_length(len))
    return false;
  put_raw(data, len);
  return true;
}

bool ByteReader::get_u8(std::uint8_t &v) {
  if (remaining() < 1)
    return false;
  v = data_[pos_++];
  return true;
}

bool ByteReader::get_u32(std::uint32_t &v) {
  if (remaining() < 4)
    return false;
  v = 0;
  for (int i = 0; i < 4; ++i)
    v |= static_cast<std::uint32_t>(data_[pos_ + i]) << (8 * i);
  pos_ += 4;
  return true;
}

bool ByteReader::get_u64(std::uint64_t &v) {
  if (remaining() < 8)
    return false;
  v = 0;
  for (int i = 0; i < 8; ++i)
    v |= static_cast<std::uint64_t>(data_[pos_ + i]) << (8 * i);
  pos_ += 8;
  return true;
}

bool ByteReader::get_i64(std::int64_t &v) {
  std::uint64_t raw = 0;
  if (!get_u64(raw))
    return false;
  v = static_cast<std::int64_t>(raw);
  return true;
}

bool ByteReader::get_raw(void *out, std::size_t len) {
  if (remaining() < len)
    return false;
  if (len > 0)
    std::memcpy(out, data_ + pos_, len);
  pos_ += len;
  return true;
}

bool ByteReader::get_length(std::size_t &len) {
  std::uint32_t raw = 0;
  if (!get_u32(raw))
    return false;
  len = raw;
  return true;
}

bool ByteReader::get_string(std::string &out) {
  std::size_t n = 0;
  if (!get_length(n) || remaining() < n)
    return false;
  out.assign(reinterpret_cast<const char *>(data_ + pos_), n);
  pos_ += n;
  return true;
}

bool ByteReader::skip(std::size_t n) {
  if (remaining() < n)
    return false;
  pos_ += n;
  return true;
}

} // namespace tiered_cache
