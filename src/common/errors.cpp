#include "tiered_cache/types.hpp"

namespace tiered_cache {

const char *to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return "ok";
  case ErrorCode::InvalidTtl:
    return "invalid ttl";
  case ErrorCode::InvalidKey:
    return "invalid key";
  case ErrorCode::Serialization:
    return "serialization error";
  case ErrorCode::BackendUnavailable:
    return "backend unavailable";
  }
  return "unknown";
}

} // namespace tiered_cache
