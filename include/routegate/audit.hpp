#pragma once

// routegate/audit.hpp — Immutable, append-only audit journal.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: entries are never modified or deleted.
//   2. SEQUENTIAL: each entry carries a monotonically increasing sequence number.
//   3. STRUCTURED: every entry is a single-line JSON object (NDJSON format).
//   4. CHAINED: each entry carries `prev`, the BLAKE3 digest of the previous
//      line as written. The first entry of a process chains from 64 zeros.
//   5. FAIL-SAFE: write failures never fail the routing call that triggered
//      them. They increment failure_count() instead.
//
// WHAT IS AUDITED:
//   - every admission or selection denial (organization, reason, timestamp),
//     so denials can be reconstructed without the decision log;
//   - every successful decision (id, selection, cost);
//   - every policy write, with the policy fingerprint;
//   - every adaptation action, applied or blocked.
//
// EXTENSION_POINT: remote_journal
//   set_audit_log_path() could accept a URI scheme for a remote immutable log
//   service. Invariant: AUDIT_LOG_VERSION must be bumped before any change to
//   the AuditRecord layout, and a sequence number is NEVER re-used.

#include <cstdint>
#include <string>

namespace routegate {

struct AuditRecord {
  uint64_t    sequence{0};           // assigned by append()
  std::string previous_digest;       // assigned by append()
  std::string kind;                  // "decision" | "denial" | "policy_write" | "adaptation"
  std::string organization_id;
  std::string subject;               // decision id, reservation id or policy fingerprint
  std::string error_code;            // empty unless kind == "denial"
  std::string detail;
  double      cost_usd{0.0};
  std::string engine_semver;
  uint32_t    audit_log_version{0};  // assigned by append()
  uint32_t    hash_algorithm_version{0};
  uint64_t    timestamp_unix_ms{0};  // stamped by append() when 0
};

std::string audit_record_to_json(const AuditRecord& r);

// Thread-safe. Each write is followed by fflush().
class ImmutableAuditLog {
 public:
  // path: file to append to, created if absent. Empty path = disabled
  // (append() succeeds without writing).
  explicit ImmutableAuditLog(const std::string& path = "");
  ~ImmutableAuditLog();

  ImmutableAuditLog(const ImmutableAuditLog&) = delete;
  ImmutableAuditLog& operator=(const ImmutableAuditLog&) = delete;

  // Assigns sequence, chain digest and versions in place. Returns false on a
  // write error, in which case the entry was NOT written. Never throws.
  bool append(AuditRecord& record);

  uint64_t entry_count() const;
  uint64_t failure_count() const;
  bool enabled() const;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  struct Impl;
  Impl* impl_{nullptr};
};

// Activated by ROUTEGATE_AUDIT_LOG=/path/to/audit.ndjson, or programmatically
// with set_audit_log_path() before the first use.
ImmutableAuditLog& global_audit_log();

// Replaces the global journal. Later global_audit_log() calls write to `path`.
void set_audit_log_path(const std::string& path);

}  // namespace routegate
