#pragma once

// routegate/policy.hpp — Per-organization guardrail configuration.
//
// DESIGN INVARIANTS (checked by validate_policy on every write):
//   1. max_request_cost_usd <= max_daily_cost_usd, both > 0.
//   2. burst_rate_limit and sustained_rate_limit are positive integers.
//   3. allowed_providers is non-empty.
//   4. task override min_perf is in [0,1]; max_cost, when set, is > 0.
//
// STORAGE:
//   PolicyStore is the read-mostly front; it caches the decoded Policy per
//   organization and invalidates on upsert()/remove(). Persistence goes
//   through IPolicyBackend, which stores the serialized JSON document.
//   The file backend keeps one <org>.json per organization under its root,
//   written tmp+rename so a crashed write never leaves a torn document.
//
// EXTENSION_POINT: relational_backend
//   A database backend implements IPolicyBackend over a `policies` table
//   keyed by organization id. The PolicyStore cache stays in front of it.
//   Invariant: backends MUST be safe for concurrent calls.
//
// TRIAL MODE:
//   Trial organizations are capped on read (apply_trial_restrictions), so a
//   stored trial policy may be looser than the one enforced.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "routegate/config.hpp"
#include "routegate/types.hpp"

namespace routegate {

struct TaskOverride {
  double min_perf{0.5};
  std::vector<std::string> preferred_models;   // ordered, most preferred first
  std::optional<double> max_cost_usd;
};

struct Policy {
  std::string organization_id;
  bool        trial_mode{false};
  double      max_daily_cost_usd{10.00};
  double      max_request_cost_usd{0.03};
  uint64_t    max_tokens_input{8000};
  uint64_t    max_tokens_output{4000};
  uint32_t    max_concurrent_jobs{10};
  std::vector<std::string> allowed_providers{"openai", "anthropic"};
  uint32_t    burst_rate_limit{10};        // per burst window (10 s)
  uint32_t    sustained_rate_limit{60};    // per sustained window (60 s)
  std::map<TaskCategory, TaskOverride> task_overrides;
  uint64_t    updated_at_unix_ms{0};

  bool allows_provider(const std::string& provider) const;
  const TaskOverride* override_for(TaskCategory task) const;
};

// Field names of every violated invariant; empty when valid.
std::vector<std::string> validate_policy(const Policy& p);

std::string policy_to_json(const Policy& p);

// BLAKE3 fingerprint of the canonical policy document.
std::string policy_fingerprint_of(const Policy& p);

struct PolicyResult {
  bool        ok{true};
  ErrorCode   error{ErrorCode::none};
  std::string detail;
  std::vector<std::string> violations;
  Policy      policy;

  std::string to_json() const;
};

// Strict decode. json_parse_error / json_duplicate_key for malformed text,
// unknown_task_category for an override keyed by an unknown task,
// invalid_policy for a schema mismatch or violated invariants.
PolicyResult policy_from_json(const std::string& text);

// Provisioning default built from the engine-wide defaults.
Policy default_policy(const std::string& org_id, const EngineConfig& cfg);

// Trial caps: daily $1.00, per request $0.01, 2 concurrent jobs,
// 2000/1000 token ceilings, burst 5, sustained 20, openai only.
// Returns the input unchanged when trial_mode is false.
Policy apply_trial_restrictions(Policy p);

// Constraints effective for one task: override values when present,
// otherwise the task's default min_perf and the policy per-request cap.
struct TaskConstraints {
  double min_perf{0.5};
  double max_cost_usd{0.0};
  std::vector<std::string> preferred_models;
};
TaskConstraints resolve_task_constraints(const Policy& p, TaskCategory task);

struct GuardrailCheck {
  bool        allowed{true};
  ErrorCode   error{ErrorCode::none};
  std::string reason;
};
GuardrailCheck check_token_limits(const Policy& p, uint64_t tokens_in, uint64_t tokens_out);

// ---------------------------------------------------------------------------
// IPolicyBackend — persistence seam
// ---------------------------------------------------------------------------
class IPolicyBackend {
 public:
  virtual ~IPolicyBackend() = default;

  virtual std::optional<std::string> load(const std::string& org_id) const = 0;
  virtual bool store(const std::string& org_id, const std::string& document) = 0;
  virtual bool remove(const std::string& org_id) = 0;
  virtual std::vector<std::string> list() const = 0;
  virtual std::string backend_id() const = 0;
};

class InMemoryPolicyBackend : public IPolicyBackend {
 public:
  std::optional<std::string> load(const std::string& org_id) const override;
  bool store(const std::string& org_id, const std::string& document) override;
  bool remove(const std::string& org_id) override;
  std::vector<std::string> list() const override;
  std::string backend_id() const override { return "memory"; }

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::string> docs_;
};

// One <org>.json per organization under root/policies/.
class FilePolicyBackend : public IPolicyBackend {
 public:
  explicit FilePolicyBackend(std::string root);

  std::optional<std::string> load(const std::string& org_id) const override;
  bool store(const std::string& org_id, const std::string& document) override;
  bool remove(const std::string& org_id) override;
  std::vector<std::string> list() const override;
  std::string backend_id() const override { return "file"; }

  const std::string& root() const { return root_; }

 private:
  std::string path_for(const std::string& org_id) const;

  std::string root_;
  mutable std::mutex mu_;
};

// ---------------------------------------------------------------------------
// PolicyStore
// ---------------------------------------------------------------------------
class PolicyStore {
 public:
  explicit PolicyStore(std::shared_ptr<IPolicyBackend> backend = nullptr);

  // Effective policy (trial restrictions applied). policy_not_found when
  // nothing is stored for the organization.
  PolicyResult get(const std::string& org_id) const;

  // The stored document as written, without trial caps.
  PolicyResult get_stored(const std::string& org_id) const;

  // Falls back to default_policy(org, cfg) when none is stored.
  Policy get_with_defaults(const std::string& org_id, const EngineConfig& cfg) const;

  // Validates, persists, invalidates the cache. The organization id in the
  // argument wins over policy.organization_id.
  PolicyResult upsert(const std::string& org_id, Policy policy);

  bool remove(const std::string& org_id);

  std::vector<std::string> organizations() const;

  uint64_t cache_hits() const;
  uint64_t cache_misses() const;

  const IPolicyBackend& backend() const { return *backend_; }

 private:
  std::shared_ptr<IPolicyBackend> backend_;
  mutable std::mutex mu_;
  mutable std::unordered_map<std::string, Policy> cache_;
  mutable uint64_t hits_{0};
  mutable uint64_t misses_{0};
};

}  // namespace routegate
