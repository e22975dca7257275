#include "routegate/version.hpp"

#include <sstream>

namespace routegate {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver   = engine_semver.empty() ? "0.3.0" : engine_semver;
  m.hash_primitive  = "blake3";
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
#if defined(ROUTEGATE_WITH_ZSTD)
  m.zstd_enabled = true;
#endif
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"policy_schema\":" << m.policy_schema
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"cache_key\":" << m.cache_key
    << ",\"audit_log\":" << m.audit_log
    << ",\"engine_semver\":\"" << m.engine_semver << "\""
    << ",\"hash_primitive\":\"" << m.hash_primitive << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << ",\"zstd\":" << (m.zstd_enabled ? "true" : "false")
    << "}";
  return o.str();
}

CompatibilityResult check_policy_schema(uint32_t document_version) {
  CompatibilityResult r;
  r.actual = document_version;
  if (document_version == 0 || document_version > POLICY_SCHEMA_VERSION) {
    r.ok          = false;
    r.error_code  = "policy_schema_mismatch";
    r.description = "Policy schema_version " + std::to_string(document_version) +
                    " is not supported (this build reads 1.." +
                    std::to_string(POLICY_SCHEMA_VERSION) + ").";
  }
  return r;
}

}  // namespace version
}  // namespace routegate
