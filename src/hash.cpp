#include "routegate/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the SOLE hash primitive. No fallbacks, no alternatives.
//   2. Domain separation: "cache:", "dec:", "rsv:", "pol:" prefixes prevent
//      cross-context collisions. The prefixes are part of the on-disk format
//      of the cache and the audit journal (version::CACHE_KEY_VERSION).
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for O(1) nibble
// encoding. snprintf("%02x") is ~3x slower due to format-string parsing.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace routegate {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.backend = "system";
  info.blake3_available = true;
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string deterministic_digest(std::string_view payload) {
  return blake3_hex(payload);
}

std::string cache_key_hash(std::string_view canonical_key_material) {
  return hash_domain("cache:", canonical_key_material);
}

std::string decision_id_hash(std::string_view canonical_decision) {
  return hash_domain("dec:", canonical_decision);
}

std::string reservation_id_hash(std::string_view material) {
  return hash_domain("rsv:", material);
}

std::string policy_fingerprint(std::string_view canonical_policy_json) {
  return hash_domain("pol:", canonical_policy_json);
}

}  // namespace routegate
