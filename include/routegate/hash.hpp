#pragma once

#include <string>
#include <string_view>

namespace routegate {

struct HashRuntimeInfo {
  std::string primitive;
  std::string backend;
  std::string version;
  bool blake3_available{false};
};

// Core BLAKE3 hashing
std::string blake3_hex(std::string_view payload);
std::string deterministic_digest(std::string_view payload);
HashRuntimeInfo hash_runtime_info();

// Domain-separated hashing for different contexts
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string cache_key_hash(std::string_view canonical_key_material);
std::string decision_id_hash(std::string_view canonical_decision);
std::string reservation_id_hash(std::string_view material);
std::string policy_fingerprint(std::string_view canonical_policy_json);

}  // namespace routegate
