#pragma once

// routegate/decision_engine.hpp — Admission + model selection for one request.
//
// ROUTE PIPELINE (route_request):
//   1. Policy       PolicyStore::get (trial caps applied). policy_not_found
//                   unless auto_provision_policies is set.
//   2. Tokens       check_token_limits.
//   3. Budget gate  UsageLedger::check_and_reserve with the admission estimate:
//                   the caller's hint, else the cheapest registered candidate
//                   from an allowed provider. Per-request cap, daily budget,
//                   concurrency, in that order.
//   4. Rate         RateLimiter::check_and_increment (burst, then sustained).
//                   A denial here releases the reservation from step 3.
//   5. Cache        When the request carries a prompt, each statically
//                   eligible candidate's key is probed, highest quality first.
//                   A hit commits the reservation at the cache serving cost.
//   6. Select       candidates = catalog.models_for(task); each is rejected
//                   for ProviderNotAllowed, CircuitOpen, BelowMinPerformance or
//                   ExceedsMaxCost (checked in that order). Survivors are
//                   scored, or under force-cheapest simply ordered by cost.
//   7. Amend        the reservation is re-estimated at the selected model's
//                   cost (re-checking the daily budget).
//   8. Record       Decision appended to the DecisionLog and the audit journal.
//
//   Every failure after step 3 releases the reservation. Every failure after
//   step 4 also refunds the rate slot: a request that never reaches a provider
//   is not counted against the organization.
//
// SCORING:
//   cost_score    = (max_cost - cost) / (max_cost - min_cost) over survivors,
//                   1.0 when all survivors cost the same
//   latency_score = same min-max form over EWMA latency (catalog prior before
//                   any telemetry)
//   error_score   = 1 - EWMA error rate
//   quality_score = static catalog rating for the task
//   total_score   = (w . scores) / sum(w), times warning_penalty when the
//                   model's circuit is half-open.
//   Ties on total_score: lower cost, then provider:model lexical order. No
//   randomness anywhere. preferred_models is recorded in the decision's
//   constraints but does not order candidates.
//
// FORCE CHEAPEST:
//   Set by the caller or when the projected budget status after reservation
//   is critical or worse. Selection takes the cheapest survivor (ties as
//   above); sub-scores are still computed so the decision stays explainable.
//
// CONCURRENCY:
//   route_request/report_outcome are safe to call concurrently. No guardrail
//   lock is held across the caller's provider call: the reservation is made
//   here and reconciled in report_outcome.

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "routegate/circuit_breaker.hpp"
#include "routegate/clock.hpp"
#include "routegate/config.hpp"
#include "routegate/decision_log.hpp"
#include "routegate/model_catalog.hpp"
#include "routegate/policy.hpp"
#include "routegate/rate_limiter.hpp"
#include "routegate/response_cache.hpp"
#include "routegate/telemetry.hpp"
#include "routegate/types.hpp"
#include "routegate/usage_ledger.hpp"

namespace routegate {

// Caller-side narrowing. Never loosens the policy.
struct CallerConstraints {
  std::optional<double> max_cost_usd;
  std::optional<double> min_perf;
  bool force_cheapest{false};
};

struct RouteRequest {
  std::string  organization_id;
  TaskCategory task{TaskCategory::chat};
  uint64_t     tokens_in{0};
  uint64_t     tokens_out{0};
  CallerConstraints constraints;
  std::optional<double> estimated_cost_usd;   // admission estimate override

  // Cache key material. Without a prompt the cache is not consulted.
  std::optional<std::string> prompt;
  std::string  system_prompt;
  std::optional<double>   temperature;
  std::optional<uint64_t> max_tokens;
};

struct RoutingDecision {
  bool        ok{true};
  ErrorCode   error{ErrorCode::none};
  std::string detail;

  std::string  decision_id;
  std::string  reservation_id;      // empty on a cache hit (already settled)
  ModelRef     selected;
  double       estimated_cost_usd{0.0};
  ScoreFactors factors;
  std::vector<Alternative> alternatives;   // on no_eligible_model: every rejected candidate
  std::string  reason;

  bool         force_cheapest{false};
  BudgetStatus budget_status{BudgetStatus::normal};
  uint64_t     retry_after_ms{0};    // rate_limited only

  bool         cache_hit{false};
  std::string  cache_key;            // key the completion should be stored under
  std::string  cached_completion;

  std::string to_json() const;
};

struct OutcomeReport {
  std::string reservation_id;
  std::optional<double> actual_cost_usd;   // unknown ⇒ the reserved estimate is charged
  double      latency_ms{0.0};
  bool        success{true};
  bool        timed_out{false};            // recorded as an error sample
  // Override the routed model (empty = the model that was selected).
  ModelRef    ref;
  // Stored in the response cache on success when the route carried a prompt.
  std::optional<std::string> completion;
};

struct OutcomeResult {
  bool        ok{true};
  ErrorCode   error{ErrorCode::none};
  std::string detail;
  std::string organization_id;
  ModelRef    ref;
  double      charged_usd{0.0};
  double      delta_usd{0.0};
  bool        cached{false};
  CircuitStatus circuit{CircuitStatus::healthy};

  std::string to_json() const;
};

// Collaborators an embedding application may supply. Anything left null is
// built from the EngineConfig.
struct EngineDeps {
  std::shared_ptr<Clock>              clock;
  std::shared_ptr<IPolicyBackend>     policy_backend;
  std::shared_ptr<const ModelCatalog> catalog;
};

class RoutingEngine {
 public:
  explicit RoutingEngine(EngineConfig cfg = EngineConfig::defaults(), EngineDeps deps = {});

  RoutingDecision route_request(const RouteRequest& req);

  // Reconciles the ledger, feeds telemetry and the circuit breaker, and
  // optionally fills the cache. Only an unknown reservation is an error;
  // provider failures are absorbed here.
  OutcomeResult report_outcome(const OutcomeReport& report);

  // Compensating release for a request abandoned before the provider call.
  CommitResult cancel(const std::string& reservation_id);

  // Administration.
  PolicyResult upsert_policy(const std::string& org_id, const Policy& policy);
  PolicyResult get_policy(const std::string& org_id) const;
  UsageSnapshot usage(const std::string& org_id) const;

  const EngineConfig& config() const { return cfg_; }
  const ModelCatalog& catalog() const { return *catalog_; }
  PolicyStore& policies() { return *policies_; }
  UsageLedger& ledger() { return *ledger_; }
  RateLimiter& rate_limiter() { return *rate_; }
  TelemetryAggregator& telemetry() { return *telemetry_; }
  CircuitBreaker& circuits() { return *circuits_; }
  ResponseCache& cache() { return *cache_; }
  DecisionLog& decisions() { return *decisions_; }
  const Clock& clock() const { return *clock_; }

  size_t pending_routes() const;

 private:
  struct Pending {
    std::string  organization_id;
    TaskCategory task{TaskCategory::chat};
    ModelRef     selected;
    std::string  cache_key;
    std::string  decision_id;
    RateDecision rate;           // admitting windows, for refund on cancel
  };

  struct Policyish {
    bool ok{true};
    ErrorCode error{ErrorCode::none};
    std::string detail;
    Policy policy;
  };

  Policyish resolve_policy(const std::string& org_id) const;

  std::string cache_key_for(const RouteRequest& req, const ModelRef& ref) const;

  EngineConfig cfg_;
  std::shared_ptr<Clock> clock_;
  std::shared_ptr<const ModelCatalog> catalog_;
  std::unique_ptr<PolicyStore> policies_;
  std::unique_ptr<UsageLedger> ledger_;
  std::unique_ptr<RateLimiter> rate_;
  std::shared_ptr<TelemetryAggregator> telemetry_;
  std::unique_ptr<CircuitBreaker> circuits_;
  std::unique_ptr<ResponseCache> cache_;
  std::unique_ptr<DecisionLog> decisions_;

  mutable std::mutex pending_mu_;
  std::unordered_map<std::string, Pending> pending_;   // reservation id -> route
};

// ---------------------------------------------------------------------------
// Selection core (pure; exposed for tests and `routegate simulate`)
// ---------------------------------------------------------------------------
struct CandidateInput {
  const ModelSpec* spec{nullptr};
  double estimated_cost_usd{0.0};
  double latency_ms{0.0};
  double error_rate{0.0};
  CircuitStatus circuit{CircuitStatus::healthy};
};

struct SelectionConstraints {
  double min_perf{0.0};
  double max_cost_usd{0.0};
  std::vector<std::string> allowed_providers;
  std::vector<std::string> preferred_models;
  bool force_cheapest{false};
};

struct SelectionResult {
  bool ok{false};
  size_t selected{0};                     // index into alternatives
  std::vector<Alternative> alternatives;  // every candidate, input order
};

SelectionResult select_model(TaskCategory task, const std::vector<CandidateInput>& candidates,
                             const SelectionConstraints& c, const ScoringWeights& w,
                             double warning_penalty);

}  // namespace routegate
