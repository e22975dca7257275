#pragma once

// routegate/version.hpp — Explicit version manifest for every persisted format.
//
// PURPOSE:
//   Prevent silent format drift across policy documents, cache keys and the
//   audit journal. Every component that reads or writes a versioned format
//   checks its constant here before processing data.
//
// INVARIANT:
//   All version constants are compile-time. Readers call
//   check_policy_schema() before accepting a stored policy and fail with a
//   structured error on mismatch. Never throws.

#include <cstdint>
#include <string>

namespace routegate {
namespace version {

// ---------------------------------------------------------------------------
// POLICY_SCHEMA_VERSION
// Tracks the JSON layout of stored policy documents ("schema_version" field).
// Documents without the field are read as version 1.
// ---------------------------------------------------------------------------
constexpr uint32_t POLICY_SCHEMA_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3 (32 bytes, hex-encoded to 64 chars) with domain prefixes.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

// ---------------------------------------------------------------------------
// CACHE_KEY_VERSION
// Tracks prompt normalization + key material layout. Any change to
// normalize_prompt() or the key material must bump this, because existing
// entries would no longer be reachable under their old keys.
// ---------------------------------------------------------------------------
constexpr uint32_t CACHE_KEY_VERSION = 1;

// ---------------------------------------------------------------------------
// AUDIT_LOG_VERSION
// Version 1 = NDJSON with seq + prev (BLAKE3 chain) + kind + payload.
// ---------------------------------------------------------------------------
constexpr uint32_t AUDIT_LOG_VERSION = 1;

struct VersionManifest {
  uint32_t policy_schema{POLICY_SCHEMA_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  uint32_t cache_key{CACHE_KEY_VERSION};
  uint32_t audit_log{AUDIT_LOG_VERSION};
  std::string engine_semver;      // from CMake project version
  std::string hash_primitive;     // "blake3"
  std::string build_timestamp;    // __DATE__ "T" __TIME__
  bool        zstd_enabled{false};
};

VersionManifest current_manifest(const std::string& engine_semver = "");
std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;    // Empty if ok
  std::string description;
  uint32_t required{POLICY_SCHEMA_VERSION};
  uint32_t actual{POLICY_SCHEMA_VERSION};
};

// Newer documents than this build understands are rejected; older ones are
// accepted (there is only one version so far).
CompatibilityResult check_policy_schema(uint32_t document_version);

}  // namespace version
}  // namespace routegate
