#include "routegate/decision_log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <utility>

#include "routegate/hash.hpp"
#include "routegate/jsonlite.hpp"

namespace routegate {

namespace {

namespace jl = jsonlite;

std::string fd(double d) { return jl::format_double(d); }

std::string fixed(double d, int places) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", places, d);
  return buf;
}

std::string percent(double ratio) { return fixed(ratio * 100.0, 1) + "%"; }

void string_array(std::ostringstream& o, const std::vector<std::string>& v) {
  o << "[";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) o << ",";
    o << "\"" << jl::escape(v[i]) << "\"";
  }
  o << "]";
}

bool matches(const Decision& d, const DecisionFilter& f) {
  if (f.task && d.task != *f.task) return false;
  if (f.provider && d.selected.provider != *f.provider) return false;
  if (f.model && d.selected.model != *f.model) return false;
  if (f.start_unix_ms && d.unix_ms < *f.start_unix_ms) return false;
  if (f.end_unix_ms && d.unix_ms > *f.end_unix_ms) return false;
  return true;
}

}  // namespace

std::string ScoreFactors::to_json() const {
  std::ostringstream o;
  o << "{\"cost_score\":" << fd(cost_score)
    << ",\"latency_score\":" << fd(latency_score)
    << ",\"error_score\":" << fd(error_score)
    << ",\"quality_score\":" << fd(quality_score)
    << ",\"total_score\":" << fd(total_score) << "}";
  return o.str();
}

std::string to_string(RejectReason r) {
  switch (r) {
    case RejectReason::none: return "";
    case RejectReason::below_min_performance: return "BelowMinPerformance";
    case RejectReason::exceeds_max_cost: return "ExceedsMaxCost";
    case RejectReason::provider_not_allowed: return "ProviderNotAllowed";
    case RejectReason::circuit_open: return "CircuitOpen";
  }
  return "";
}

std::string Alternative::to_json() const {
  std::ostringstream o;
  o << "{\"provider\":\"" << jl::escape(ref.provider) << "\""
    << ",\"model\":\"" << jl::escape(ref.model) << "\""
    << ",\"score\":" << fd(factors.total_score)
    << ",\"factors\":" << factors.to_json()
    << ",\"estimated_cost_usd\":" << fd(estimated_cost_usd)
    << ",\"rejected\":" << (rejected ? "true" : "false");
  if (rejected) o << ",\"reject_reason\":\"" << to_string(reject_reason) << "\"";
  if (half_open) o << ",\"half_open\":true";
  o << "}";
  return o.str();
}

std::string ConstraintSnapshot::to_json() const {
  std::ostringstream o;
  o << "{\"min_perf\":" << fd(min_perf)
    << ",\"max_cost_usd\":" << fd(max_cost_usd)
    << ",\"allowed_providers\":";
  string_array(o, allowed_providers);
  o << ",\"preferred_models\":";
  string_array(o, preferred_models);
  o << ",\"force_cheapest\":" << (force_cheapest ? "true" : "false") << "}";
  return o.str();
}

std::string Decision::to_json() const {
  std::ostringstream o;
  o << "{\"id\":\"" << id << "\""
    << ",\"organization_id\":\"" << jl::escape(organization_id) << "\""
    << ",\"timestamp\":\"" << unix_ms_to_iso(unix_ms) << "\""
    << ",\"task_category\":\"" << to_string(task) << "\""
    << ",\"selected_provider\":\"" << jl::escape(selected.provider) << "\""
    << ",\"selected_model\":\"" << jl::escape(selected.model) << "\""
    << ",\"estimated_cost_usd\":" << fd(estimated_cost_usd)
    << ",\"factors\":" << factors.to_json()
    << ",\"weights\":{\"cost\":" << fd(weights.cost)
    << ",\"latency\":" << fd(weights.latency)
    << ",\"error\":" << fd(weights.error)
    << ",\"quality\":" << fd(weights.quality) << "}"
    << ",\"alternatives\":[";
  for (size_t i = 0; i < alternatives.size(); ++i) {
    if (i) o << ",";
    o << alternatives[i].to_json();
  }
  o << "],\"constraints\":" << constraints.to_json();
  if (telemetry) {
    o << ",\"telemetry\":{\"latency_ms\":" << fd(telemetry->latency_ms)
      << ",\"error_rate\":" << fd(telemetry->error_rate)
      << ",\"request_count\":" << telemetry->request_count << "}";
  }
  o << ",\"reason\":\"" << jl::escape(reason) << "\""
    << ",\"cache_hit\":" << (cache_hit ? "true" : "false")
    << ",\"budget_status\":\"" << to_string(budget_status) << "\""
    << ",\"reservation_id\":\"" << reservation_id << "\"}";
  return o.str();
}

// ---------------------------------------------------------------------------
// Explainability
// ---------------------------------------------------------------------------

std::string DecisionInsights::to_json() const {
  std::ostringstream o;
  o << "{\"primary_factor\":\"" << primary_factor << "\""
    << ",\"budget_constrained\":" << (budget_constrained ? "true" : "false")
    << ",\"alternatives_considered\":" << alternatives_considered
    << ",\"alternatives_filtered\":" << alternatives_filtered
    << ",\"cost_efficiency\":\"" << cost_efficiency << "\"}";
  return o.str();
}

std::string DecisionExplanation::to_json() const {
  std::ostringstream o;
  o << "{\"decision\":" << decision.to_json()
    << ",\"summary\":\"" << jl::escape(summary) << "\""
    << ",\"insights\":" << insights.to_json() << "}";
  return o.str();
}

DecisionInsights analyze_decision(const Decision& d) {
  DecisionInsights in;

  // Largest weighted contribution; earlier entries win ties.
  const std::pair<const char*, double> contributions[] = {
      {"cost", d.weights.cost * d.factors.cost_score},
      {"latency", d.weights.latency * d.factors.latency_score},
      {"error", d.weights.error * d.factors.error_score},
      {"quality", d.weights.quality * d.factors.quality_score},
  };
  double best = -1.0;
  for (const auto& [name, value] : contributions) {
    if (value > best) {
      best = value;
      in.primary_factor = name;
    }
  }

  for (const auto& alt : d.alternatives) {
    if (alt.rejected) {
      ++in.alternatives_filtered;
    } else {
      ++in.alternatives_considered;
    }
  }

  in.budget_constrained = d.constraints.force_cheapest || d.budget_status == BudgetStatus::critical ||
                          d.budget_status == BudgetStatus::exceeded;

  // A near-equal admissible alternative that is much cheaper means the pick
  // paid for little. A near-equal one at any price means the pick was merely good.
  in.cost_efficiency = "optimal";
  if (!d.constraints.force_cheapest) {
    for (const auto& alt : d.alternatives) {
      if (alt.rejected) continue;
      if (std::fabs(alt.factors.total_score - d.factors.total_score) >= 0.1) continue;
      if (alt.estimated_cost_usd < d.estimated_cost_usd * 0.5) {
        in.cost_efficiency = "poor";
        break;
      }
      in.cost_efficiency = "good";
    }
  }
  return in;
}

std::string summarize_decision(const Decision& d) {
  std::ostringstream o;
  o << "Decision for " << to_string(d.task) << " task:\n"
    << "Selected: " << d.selected.key() << "\n"
    << "Cost: $" << fixed(d.estimated_cost_usd, 6) << "\n";
  if (d.cache_hit) o << "Served from response cache\n";
  o << "\nDecision Factors:\n"
    << "  Cost Score: " << percent(d.factors.cost_score) << "\n"
    << "  Latency Score: " << percent(d.factors.latency_score) << "\n"
    << "  Error Score: " << percent(d.factors.error_score) << "\n"
    << "  Quality Score: " << percent(d.factors.quality_score) << "\n"
    << "  Total Score: " << fixed(d.factors.total_score, 4) << " (higher is better)\n"
    << "\nPolicy Constraints:\n"
    << "  Min Performance: " << percent(d.constraints.min_perf) << "\n"
    << "  Max Cost: $" << fixed(d.constraints.max_cost_usd, 4) << "\n"
    << "  Allowed Providers: ";
  for (size_t i = 0; i < d.constraints.allowed_providers.size(); ++i) {
    if (i) o << ", ";
    o << d.constraints.allowed_providers[i];
  }
  o << "\n";
  if (d.constraints.force_cheapest) o << "  FORCED CHEAPEST (budget " << to_string(d.budget_status) << ")\n";

  if (!d.alternatives.empty()) {
    o << "\nAlternatives Considered (" << d.alternatives.size() << "):\n";
    const size_t shown = std::min<size_t>(d.alternatives.size(), 5);
    for (size_t i = 0; i < shown; ++i) {
      const auto& alt = d.alternatives[i];
      o << "  " << (alt.rejected ? "rejected (" + to_string(alt.reject_reason) + ")" : std::string("eligible"))
        << " " << alt.ref.key() << " (score: " << fixed(alt.factors.total_score, 4) << ")\n";
    }
  }

  if (d.telemetry) {
    o << "\nPerformance Telemetry:\n"
      << "  Latency: " << fixed(d.telemetry->latency_ms, 0) << "ms\n"
      << "  Error Rate: " << fixed(d.telemetry->error_rate * 100.0, 2) << "%\n"
      << "  Request Count: " << d.telemetry->request_count << "\n";
  }

  o << "\nRationale: " << d.reason;
  return o.str();
}

std::string DecisionStats::to_json() const {
  std::ostringstream o;
  o << "{\"total_decisions\":" << total << ",\"by_model\":{";
  bool first = true;
  for (const auto& [k, n] : by_model) {
    if (!first) o << ",";
    first = false;
    o << "\"" << jl::escape(k) << "\":" << n;
  }
  o << "},\"by_task_category\":{";
  first = true;
  for (const auto& [k, n] : by_task) {
    if (!first) o << ",";
    first = false;
    o << "\"" << k << "\":" << n;
  }
  o << "},\"avg_cost_usd\":" << fd(avg_cost_usd)
    << ",\"force_cheapest_count\":" << force_cheapest_count
    << ",\"cache_hits\":" << cache_hits << "}";
  return o.str();
}

std::string ModelSelectionStats::to_json() const {
  std::ostringstream o;
  o << "{\"provider\":\"" << jl::escape(ref.provider) << "\""
    << ",\"model\":\"" << jl::escape(ref.model) << "\""
    << ",\"times_selected\":" << times_selected
    << ",\"avg_cost_usd\":" << fd(avg_cost_usd)
    << ",\"avg_score\":" << fd(avg_score)
    << ",\"last_used\":\"" << unix_ms_to_iso(last_used_unix_ms) << "\"}";
  return o.str();
}

// ---------------------------------------------------------------------------
// DecisionLog
// ---------------------------------------------------------------------------

DecisionLog::DecisionLog(uint32_t retention_per_org)
    : retention_(retention_per_org ? retention_per_org : 1) {}

Decision DecisionLog::record(Decision d) {
  std::lock_guard<std::mutex> lk(mu_);
  if (d.id.empty()) {
    const std::string material = d.organization_id + ":" + std::to_string(++seq_) + ":" +
                                 std::to_string(d.unix_ms) + ":" + to_string(d.task) + ":" +
                                 d.selected.key();
    d.id = "dec-" + decision_id_hash(material).substr(0, 32);
  }

  auto& q = by_org_[d.organization_id];
  q.push_front(d);
  owner_[d.id] = d.organization_id;
  while (q.size() > retention_) {
    owner_.erase(q.back().id);
    q.pop_back();
  }
  journal(d);
  return d;
}

std::vector<Decision> DecisionLog::history(const std::string& org_id, const DecisionFilter& filter) const {
  std::vector<Decision> out;
  std::lock_guard<std::mutex> lk(mu_);
  auto it = by_org_.find(org_id);
  if (it == by_org_.end()) return out;
  for (const auto& d : it->second) {
    if (!matches(d, filter)) continue;
    out.push_back(d);
    if (filter.limit && out.size() >= filter.limit) break;
  }
  return out;
}

std::optional<Decision> DecisionLog::get(const std::string& decision_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto owner = owner_.find(decision_id);
  if (owner == owner_.end()) return std::nullopt;
  auto it = by_org_.find(owner->second);
  if (it == by_org_.end()) return std::nullopt;
  for (const auto& d : it->second) {
    if (d.id == decision_id) return d;
  }
  return std::nullopt;
}

std::optional<Decision> DecisionLog::latest(const std::string& org_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = by_org_.find(org_id);
  if (it == by_org_.end() || it->second.empty()) return std::nullopt;
  return it->second.front();
}

std::optional<DecisionExplanation> DecisionLog::explain(const std::string& decision_id) const {
  auto d = get(decision_id);
  if (!d) return std::nullopt;
  DecisionExplanation e;
  e.summary = summarize_decision(*d);
  e.insights = analyze_decision(*d);
  e.decision = std::move(*d);
  return e;
}

DecisionStats DecisionLog::stats(const std::string& org_id) const {
  DecisionStats s;
  double total_cost = 0.0;
  for (const auto& d : history(org_id)) {
    ++s.total;
    ++s.by_model[d.selected.key()];
    ++s.by_task[to_string(d.task)];
    total_cost += d.estimated_cost_usd;
    if (d.constraints.force_cheapest) ++s.force_cheapest_count;
    if (d.cache_hit) ++s.cache_hits;
  }
  s.avg_cost_usd = s.total ? total_cost / static_cast<double>(s.total) : 0.0;
  return s;
}

std::vector<ModelSelectionStats> DecisionLog::provider_performance(const std::string& org_id) const {
  struct Acc {
    ModelRef ref;
    uint64_t count{0};
    double cost{0.0};
    double score{0.0};
    uint64_t last_used{0};
  };
  std::map<std::string, Acc> acc;
  for (const auto& d : history(org_id)) {
    Acc& a = acc[d.selected.key()];
    a.ref = d.selected;
    ++a.count;
    a.cost += d.estimated_cost_usd;
    a.score += d.factors.total_score;
    a.last_used = std::max(a.last_used, d.unix_ms);
  }

  std::vector<ModelSelectionStats> out;
  out.reserve(acc.size());
  for (const auto& [key, a] : acc) {
    ModelSelectionStats m;
    m.ref = a.ref;
    m.times_selected = a.count;
    m.avg_cost_usd = a.cost / static_cast<double>(a.count);
    m.avg_score = a.score / static_cast<double>(a.count);
    m.last_used_unix_ms = a.last_used;
    out.push_back(m);
  }
  std::stable_sort(out.begin(), out.end(), [](const ModelSelectionStats& a, const ModelSelectionStats& b) {
    return a.times_selected > b.times_selected;
  });
  return out;
}

std::vector<ModelSelectionStats> DecisionLog::trending(const std::string& org_id, size_t limit) const {
  auto out = provider_performance(org_id);
  std::stable_sort(out.begin(), out.end(), [](const ModelSelectionStats& a, const ModelSelectionStats& b) {
    if (a.times_selected != b.times_selected) return a.times_selected > b.times_selected;
    return a.last_used_unix_ms > b.last_used_unix_ms;
  });
  if (out.size() > limit) out.resize(limit);
  return out;
}

size_t DecisionLog::total_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return owner_.size();
}

void DecisionLog::set_journal_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(mu_);
  journal_path_ = path;
}

void DecisionLog::journal(const Decision& d) const {
  if (journal_path_.empty()) return;
  const std::string line = d.to_json() + "\n";
  if (FILE* f = std::fopen(journal_path_.c_str(), "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace routegate
