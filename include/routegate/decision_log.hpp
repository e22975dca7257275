#pragma once

// routegate/decision_log.hpp — Append-only record of every routing selection.
//
// DESIGN INVARIANTS:
//   1. APPEND-ONLY: a Decision is never mutated after record(). Readers get
//      copies.
//   2. SUCCESSFUL SELECTIONS ONLY: denials are not decisions. They go to the
//      audit journal and the router event stream instead.
//   3. BOUNDED: each organization keeps its newest `retention_per_org`
//      decisions. Older ones fall off the back; ids of evicted decisions stop
//      resolving.
//   4. NEWEST FIRST: history() and every aggregate walk decisions from newest
//      to oldest.
//
// DECISION IDS:
//   "dec-" + 32 hex chars of BLAKE3("dec:" + org + seq + timestamp + task +
//   selection). The per-log sequence number keeps two identical requests in
//   the same millisecond distinct.
//
// EXTENSION_POINT: decision_store
//   Current: per-organization in-memory deques plus an optional JSONL journal
//   (set_journal_path) that mirrors every record.
//   Upgrade: a `decision_log` table keyed by (organization_id, id) with
//   secondary indexes on timestamp, task category and provider.

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "routegate/config.hpp"
#include "routegate/types.hpp"
#include "routegate/usage_ledger.hpp"

namespace routegate {

// Sub-scores are in [0,1], higher is better. total_score is the weighted sum
// after the half-open penalty.
struct ScoreFactors {
  double cost_score{0.0};
  double latency_score{0.0};
  double error_score{0.0};
  double quality_score{0.0};
  double total_score{0.0};

  bool operator==(const ScoreFactors& o) const {
    return cost_score == o.cost_score && latency_score == o.latency_score &&
           error_score == o.error_score && quality_score == o.quality_score &&
           total_score == o.total_score;
  }

  std::string to_json() const;
};

enum class RejectReason {
  none,
  below_min_performance,
  exceeds_max_cost,
  provider_not_allowed,
  circuit_open,
};

// "BelowMinPerformance" | "ExceedsMaxCost" | "ProviderNotAllowed" | "CircuitOpen"
std::string to_string(RejectReason r);

struct Alternative {
  ModelRef     ref;
  ScoreFactors factors;
  double       estimated_cost_usd{0.0};
  bool         rejected{false};
  RejectReason reject_reason{RejectReason::none};
  bool         half_open{false};      // scored with the warning penalty

  std::string to_json() const;
};

struct ConstraintSnapshot {
  double                   min_perf{0.0};
  double                   max_cost_usd{0.0};
  std::vector<std::string> allowed_providers;
  std::vector<std::string> preferred_models;
  bool                     force_cheapest{false};

  std::string to_json() const;
};

struct TelemetrySnapshot {
  double   latency_ms{0.0};
  double   error_rate{0.0};
  uint64_t request_count{0};
};

struct Decision {
  std::string  id;
  std::string  organization_id;
  uint64_t     unix_ms{0};
  TaskCategory task{TaskCategory::chat};
  ModelRef     selected;
  double       estimated_cost_usd{0.0};
  ScoreFactors factors;
  ScoringWeights weights;
  std::vector<Alternative> alternatives;   // every other candidate, rejected ones included
  ConstraintSnapshot constraints;
  std::optional<TelemetrySnapshot> telemetry;
  std::string  reason;
  bool         cache_hit{false};
  BudgetStatus budget_status{BudgetStatus::normal};
  std::string  reservation_id;

  std::string to_json() const;
};

struct DecisionFilter {
  std::optional<TaskCategory> task;
  std::optional<std::string>  provider;
  std::optional<std::string>  model;
  std::optional<uint64_t>     start_unix_ms;   // inclusive
  std::optional<uint64_t>     end_unix_ms;     // inclusive
  size_t                      limit{0};        // 0 = no limit
};

struct DecisionInsights {
  std::string primary_factor;          // "cost" | "latency" | "error" | "quality"
  bool        budget_constrained{false};
  size_t      alternatives_considered{0};
  size_t      alternatives_filtered{0};
  std::string cost_efficiency;         // "optimal" | "good" | "poor"

  std::string to_json() const;
};

struct DecisionExplanation {
  Decision         decision;
  std::string      summary;            // multi-line natural language account
  DecisionInsights insights;

  std::string to_json() const;
};

// Pure functions over a recorded decision.
DecisionInsights analyze_decision(const Decision& d);
std::string summarize_decision(const Decision& d);

struct DecisionStats {
  uint64_t total{0};
  std::map<std::string, uint64_t> by_model;   // "provider:model"
  std::map<std::string, uint64_t> by_task;    // wire name
  double   avg_cost_usd{0.0};
  uint64_t force_cheapest_count{0};
  uint64_t cache_hits{0};

  std::string to_json() const;
};

struct ModelSelectionStats {
  ModelRef ref;
  uint64_t times_selected{0};
  double   avg_cost_usd{0.0};
  double   avg_score{0.0};
  uint64_t last_used_unix_ms{0};

  std::string to_json() const;
};

class DecisionLog {
 public:
  explicit DecisionLog(uint32_t retention_per_org = 1000);

  // Assigns d.id when empty and returns the stored copy.
  Decision record(Decision d);

  std::vector<Decision> history(const std::string& org_id, const DecisionFilter& filter = {}) const;
  std::optional<Decision> get(const std::string& decision_id) const;
  std::optional<Decision> latest(const std::string& org_id) const;

  std::optional<DecisionExplanation> explain(const std::string& decision_id) const;

  DecisionStats stats(const std::string& org_id) const;

  // Sorted by times selected, then provider/model.
  std::vector<ModelSelectionStats> provider_performance(const std::string& org_id) const;

  // provider_performance() truncated to `limit`, ties broken by most recent use.
  std::vector<ModelSelectionStats> trending(const std::string& org_id, size_t limit = 5) const;

  size_t total_count() const;

  // Mirrors every record() as one JSON line. Empty path disables the journal.
  void set_journal_path(const std::string& path);

 private:
  void journal(const Decision& d) const;

  uint32_t retention_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::deque<Decision>> by_org_;   // newest at front
  std::unordered_map<std::string, std::string> owner_;             // decision id -> org
  uint64_t seq_{0};
  std::string journal_path_;
};

}  // namespace routegate
