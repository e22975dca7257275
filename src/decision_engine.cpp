#include "routegate/decision_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>

#include "routegate/audit.hpp"
#include "routegate/jsonlite.hpp"
#include "routegate/observability.hpp"

namespace routegate {

namespace {

namespace jl = jsonlite;

constexpr double kCostEpsilon = 1e-12;
constexpr double kScoreEpsilon = 1e-12;

std::string fd(double d) { return jl::format_double(d); }

std::string fixed4(double d) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.4f", d);
  return buf;
}

// 1.0 for the lowest value, 0.0 for the highest; 1.0 for everyone when equal.
double min_max_inverse(double v, double lo, double hi) {
  if (hi - lo <= kCostEpsilon) return 1.0;
  return std::clamp((hi - v) / (hi - lo), 0.0, 1.0);
}

void audit(const std::string& kind, const std::string& org, const std::string& subject,
           ErrorCode error, const std::string& detail, double cost_usd, uint64_t unix_ms) {
  AuditRecord rec;
  rec.kind = kind;
  rec.organization_id = org;
  rec.subject = subject;
  rec.error_code = error == ErrorCode::none ? "" : to_string(error);
  rec.detail = detail;
  rec.cost_usd = cost_usd;
  rec.engine_semver = PROJECT_VERSION;
  rec.timestamp_unix_ms = unix_ms;
  global_audit_log().append(rec);
}

}  // namespace

// ---------------------------------------------------------------------------
// Selection core
// ---------------------------------------------------------------------------

SelectionResult select_model(TaskCategory task, const std::vector<CandidateInput>& candidates,
                             const SelectionConstraints& c, const ScoringWeights& w,
                             double warning_penalty) {
  SelectionResult r;
  r.alternatives.reserve(candidates.size());

  std::vector<size_t> survivors;
  for (size_t i = 0; i < candidates.size(); ++i) {
    const CandidateInput& in = candidates[i];
    Alternative alt;
    alt.ref = in.spec->ref;
    alt.estimated_cost_usd = in.estimated_cost_usd;
    auto q = in.spec->quality.find(task);
    alt.factors.quality_score = q == in.spec->quality.end() ? 0.0 : q->second;

    const bool provider_ok = std::find(c.allowed_providers.begin(), c.allowed_providers.end(),
                                       alt.ref.provider) != c.allowed_providers.end();
    if (!provider_ok) {
      alt.rejected = true;
      alt.reject_reason = RejectReason::provider_not_allowed;
    } else if (in.circuit == CircuitStatus::critical) {
      alt.rejected = true;
      alt.reject_reason = RejectReason::circuit_open;
    } else if (alt.factors.quality_score + kScoreEpsilon < c.min_perf) {
      alt.rejected = true;
      alt.reject_reason = RejectReason::below_min_performance;
    } else if (in.estimated_cost_usd > c.max_cost_usd + kCostEpsilon) {
      alt.rejected = true;
      alt.reject_reason = RejectReason::exceeds_max_cost;
    } else {
      alt.half_open = in.circuit == CircuitStatus::warning;
      survivors.push_back(i);
    }
    r.alternatives.push_back(alt);
  }
  if (survivors.empty()) return r;

  double cost_lo = std::numeric_limits<double>::max(), cost_hi = 0.0;
  double lat_lo = std::numeric_limits<double>::max(), lat_hi = 0.0;
  for (size_t i : survivors) {
    cost_lo = std::min(cost_lo, candidates[i].estimated_cost_usd);
    cost_hi = std::max(cost_hi, candidates[i].estimated_cost_usd);
    lat_lo = std::min(lat_lo, candidates[i].latency_ms);
    lat_hi = std::max(lat_hi, candidates[i].latency_ms);
  }

  const double wsum = w.sum() > 0.0 ? w.sum() : 1.0;
  for (size_t i : survivors) {
    ScoreFactors& f = r.alternatives[i].factors;
    f.cost_score = min_max_inverse(candidates[i].estimated_cost_usd, cost_lo, cost_hi);
    f.latency_score = min_max_inverse(candidates[i].latency_ms, lat_lo, lat_hi);
    f.error_score = std::clamp(1.0 - candidates[i].error_rate, 0.0, 1.0);
    f.total_score = (w.cost * f.cost_score + w.latency * f.latency_score + w.error * f.error_score +
                     w.quality * f.quality_score) / wsum;
    if (r.alternatives[i].half_open) f.total_score *= warning_penalty;
  }

  // Deterministic ordering shared by both modes after the primary key.
  auto tie_break = [&](size_t a, size_t b) {
    const Alternative& x = r.alternatives[a];
    const Alternative& y = r.alternatives[b];
    if (std::fabs(x.estimated_cost_usd - y.estimated_cost_usd) > kCostEpsilon) {
      return x.estimated_cost_usd < y.estimated_cost_usd;
    }
    return x.ref < y.ref;
  };

  size_t best = survivors.front();
  for (size_t k = 1; k < survivors.size(); ++k) {
    const size_t i = survivors[k];
    bool better;
    if (c.force_cheapest) {
      better = tie_break(i, best);
    } else {
      const double d = r.alternatives[i].factors.total_score - r.alternatives[best].factors.total_score;
      better = d > kScoreEpsilon || (std::fabs(d) <= kScoreEpsilon && tie_break(i, best));
    }
    if (better) best = i;
  }

  r.ok = true;
  r.selected = best;
  return r;
}

// ---------------------------------------------------------------------------
// Result serialization
// ---------------------------------------------------------------------------

std::string RoutingDecision::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false");
  if (!ok) {
    o << ",\"error_code\":\"" << to_string(error) << "\""
      << ",\"detail\":\"" << jl::escape(detail) << "\"";
    if (error == ErrorCode::rate_limited) o << ",\"retry_after_ms\":" << retry_after_ms;
  } else {
    o << ",\"decision_id\":\"" << decision_id << "\""
      << ",\"reservation_id\":\"" << reservation_id << "\""
      << ",\"provider\":\"" << jl::escape(selected.provider) << "\""
      << ",\"model\":\"" << jl::escape(selected.model) << "\""
      << ",\"estimated_cost_usd\":" << fd(estimated_cost_usd)
      << ",\"factors\":" << factors.to_json()
      << ",\"reason\":\"" << jl::escape(reason) << "\""
      << ",\"force_cheapest\":" << (force_cheapest ? "true" : "false")
      << ",\"cache_hit\":" << (cache_hit ? "true" : "false");
    if (!cache_key.empty()) o << ",\"cache_key\":\"" << cache_key << "\"";
    if (cache_hit) o << ",\"completion\":\"" << jl::escape(cached_completion) << "\"";
  }
  o << ",\"budget_status\":\"" << to_string(budget_status) << "\"";
  if (!alternatives.empty()) {
    o << ",\"alternatives\":[";
    for (size_t i = 0; i < alternatives.size(); ++i) {
      if (i) o << ",";
      o << alternatives[i].to_json();
    }
    o << "]";
  }
  o << "}";
  return o.str();
}

std::string OutcomeResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false");
  if (!ok) {
    o << ",\"error_code\":\"" << to_string(error) << "\""
      << ",\"detail\":\"" << jl::escape(detail) << "\"}";
    return o.str();
  }
  o << ",\"organization_id\":\"" << jl::escape(organization_id) << "\""
    << ",\"provider\":\"" << jl::escape(ref.provider) << "\""
    << ",\"model\":\"" << jl::escape(ref.model) << "\""
    << ",\"charged_usd\":" << fd(charged_usd)
    << ",\"delta_usd\":" << fd(delta_usd)
    << ",\"cached\":" << (cached ? "true" : "false")
    << ",\"circuit\":\"" << to_string(circuit) << "\"}";
  return o.str();
}

// ---------------------------------------------------------------------------
// RoutingEngine
// ---------------------------------------------------------------------------

RoutingEngine::RoutingEngine(EngineConfig cfg, EngineDeps deps)
    : cfg_(std::move(cfg)),
      clock_(deps.clock ? std::move(deps.clock) : system_clock()),
      catalog_(deps.catalog ? std::move(deps.catalog)
                            : std::make_shared<const ModelCatalog>(default_catalog())) {
  policies_ = std::make_unique<PolicyStore>(std::move(deps.policy_backend));
  ledger_ = std::make_unique<UsageLedger>(clock_);
  rate_ = std::make_unique<RateLimiter>(cfg_.rate, clock_);
  telemetry_ = std::make_shared<TelemetryAggregator>(cfg_.telemetry, cfg_.circuit, clock_);
  circuits_ = std::make_unique<CircuitBreaker>(cfg_.circuit, telemetry_, clock_);
  cache_ = std::make_unique<ResponseCache>(cfg_.cache, clock_);
  decisions_ = std::make_unique<DecisionLog>(cfg_.decision_retention_per_org);
}

RoutingEngine::Policyish RoutingEngine::resolve_policy(const std::string& org_id) const {
  Policyish out;
  PolicyResult pr = policies_->get(org_id);
  if (pr.ok) {
    out.policy = std::move(pr.policy);
    return out;
  }
  if (pr.error == ErrorCode::policy_not_found && cfg_.auto_provision_policies) {
    out.policy = default_policy(org_id, cfg_);
    return out;
  }
  out.ok = false;
  out.error = pr.error;
  out.detail = pr.detail;
  return out;
}

std::string RoutingEngine::cache_key_for(const RouteRequest& req, const ModelRef& ref) const {
  CacheKeyMaterial m;
  m.prompt = *req.prompt;
  m.system_prompt = req.system_prompt;
  m.ref = ref;
  m.temperature = req.temperature.value_or(cfg_.cache.default_temperature);
  m.max_tokens = req.max_tokens.value_or(cfg_.cache.default_max_tokens);
  return compute_cache_key(m);
}

RoutingDecision RoutingEngine::route_request(const RouteRequest& req) {
  RoutingDecision out;
  RouterEvent ev;
  ev.kind = "route";
  ev.organization_id = req.organization_id;
  ev.task = to_string(req.task);
  ev.unix_ms = clock_->unix_ms();

  std::string reservation_id;
  std::optional<RateDecision> rate_slot;

  // Single exit for every denial: undo what was taken, then log and emit.
  auto deny = [&](ErrorCode code, const std::string& detail) {
    out.detail = detail;
    if (!reservation_id.empty()) {
      CommitResult released = ledger_->release(reservation_id);
      if (!released.ok) out.detail += " (release failed: " + released.detail + ")";
      reservation_id.clear();
    }
    if (rate_slot) rate_->refund(req.organization_id, *rate_slot);
    out.ok = false;
    out.error = code;
    ev.ok = false;
    ev.error = code;
    audit("denial", req.organization_id, to_string(req.task), code, out.detail, out.estimated_cost_usd,
          ev.unix_ms);
  };

  {
    ScopeTimer timer(ev.duration_ns);
    [&] {
      // 1. Policy
      Policyish pol = resolve_policy(req.organization_id);
      if (!pol.ok) return deny(pol.error, pol.detail);
      const Policy& policy = pol.policy;

      // 2. Token guardrails
      GuardrailCheck tokens = check_token_limits(policy, req.tokens_in, req.tokens_out);
      if (!tokens.allowed) return deny(tokens.error, tokens.reason);

      // Constraint resolution: the policy, narrowed by the caller.
      TaskConstraints tc = resolve_task_constraints(policy, req.task);
      SelectionConstraints sc;
      sc.min_perf = std::max(tc.min_perf, req.constraints.min_perf.value_or(0.0));
      sc.max_cost_usd = tc.max_cost_usd;
      if (req.constraints.max_cost_usd) sc.max_cost_usd = std::min(sc.max_cost_usd, *req.constraints.max_cost_usd);
      sc.allowed_providers = policy.allowed_providers;
      sc.preferred_models = tc.preferred_models;

      const auto specs = catalog_->models_for(req.task);

      // 3. Budget gate with the admission estimate.
      double admission = 0.0;
      if (req.estimated_cost_usd) {
        admission = std::max(0.0, *req.estimated_cost_usd);
      } else {
        bool any = false;
        for (const ModelSpec* s : specs) {
          if (!policy.allows_provider(s->ref.provider)) continue;
          const double est = catalog_->estimate_cost(s->ref, req.tokens_in, req.tokens_out);
          admission = any ? std::min(admission, est) : est;
          any = true;
        }
      }
      out.estimated_cost_usd = admission;

      BudgetDecision budget = ledger_->check_and_reserve(policy, admission);
      out.budget_status = budget.projected_status;
      if (!budget.ok) return deny(budget.error, budget.detail);
      reservation_id = budget.reservation.id;

      // 4. Rate limits
      RateDecision rate = rate_->check_and_increment(req.organization_id, policy.burst_rate_limit,
                                                     policy.sustained_rate_limit);
      if (!rate.allowed) {
        out.retry_after_ms = rate.retry_after_ms;
        return deny(rate.error, "rate limit reached on " + rate.window + " window");
      }
      rate_slot = rate;

      sc.force_cheapest = req.constraints.force_cheapest ||
                          budget.projected_status == BudgetStatus::critical ||
                          budget.projected_status == BudgetStatus::exceeded;
      out.force_cheapest = sc.force_cheapest;

      // Candidate inputs: live telemetry and circuit state per model.
      std::vector<CandidateInput> inputs;
      inputs.reserve(specs.size());
      for (const ModelSpec* s : specs) {
        CandidateInput in;
        in.spec = s;
        in.estimated_cost_usd = catalog_->estimate_cost(s->ref, req.tokens_in, req.tokens_out);
        in.latency_ms = s->default_latency_ms;
        if (policy.allows_provider(s->ref.provider)) {
          if (auto t = telemetry_->model(s->ref); t && t->total_requests > 0) {
            in.latency_ms = t->ewma_latency_ms;
            in.error_rate = t->ewma_error_rate;
          }
          in.circuit = circuits_->status(s->ref);
        }
        inputs.push_back(in);
      }

      // 5. Cache probe over the statically eligible models, best quality first.
      if (req.prompt && cache_->enabled()) {
        std::vector<size_t> order;
        for (size_t i = 0; i < inputs.size(); ++i) {
          const CandidateInput& in = inputs[i];
          const double q = in.spec->quality.at(req.task);
          if (!policy.allows_provider(in.spec->ref.provider) || in.circuit == CircuitStatus::critical) continue;
          if (q + kScoreEpsilon < sc.min_perf || in.estimated_cost_usd > sc.max_cost_usd + kCostEpsilon) continue;
          order.push_back(i);
        }
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
          const double qa = inputs[a].spec->quality.at(req.task);
          const double qb = inputs[b].spec->quality.at(req.task);
          if (qa != qb) return qa > qb;
          return inputs[a].spec->ref < inputs[b].spec->ref;
        });
        for (size_t i : order) {
          const ModelRef& ref = inputs[i].spec->ref;
          const std::string key = cache_key_for(req, ref);
          if (!cache_->peek(key)) continue;
          auto hit = cache_->lookup(key);
          if (!hit) continue;

          const double serving = cfg_.cache.serving_cost_usd;
          CommitResult settled = ledger_->commit(reservation_id, serving);
          if (!settled.ok) return deny(settled.error, settled.detail);
          reservation_id.clear();

          SelectionResult sel = select_model(req.task, inputs, sc, cfg_.weights, cfg_.warning_penalty);
          Decision d;
          d.organization_id = req.organization_id;
          d.unix_ms = ev.unix_ms;
          d.task = req.task;
          d.selected = ref;
          d.estimated_cost_usd = serving;
          d.weights = cfg_.weights;
          for (size_t k = 0; k < sel.alternatives.size(); ++k) {
            if (k == i) {
              d.factors = sel.alternatives[k].factors;
            } else {
              d.alternatives.push_back(sel.alternatives[k]);
            }
          }
          d.constraints = {sc.min_perf, sc.max_cost_usd, sc.allowed_providers, sc.preferred_models,
                           sc.force_cheapest};
          d.reason = "Served from response cache (" + ref.key() + ", hit " +
                     std::to_string(hit->hit_count) + ")";
          d.cache_hit = true;
          d.budget_status = budget.projected_status;
          d = decisions_->record(std::move(d));

          out.decision_id = d.id;
          out.selected = ref;
          out.estimated_cost_usd = serving;
          out.factors = d.factors;
          out.alternatives = d.alternatives;
          out.reason = d.reason;
          out.cache_hit = true;
          out.cache_key = key;
          out.cached_completion = std::move(hit->completion);
          return;
        }
      }

      // 6. Select
      SelectionResult sel = select_model(req.task, inputs, sc, cfg_.weights, cfg_.warning_penalty);
      if (!sel.ok) {
        out.alternatives = sel.alternatives;
        return deny(ErrorCode::no_eligible_model,
                    std::to_string(sel.alternatives.size()) + " candidates for " + to_string(req.task) +
                        ", none eligible");
      }
      const Alternative& chosen = sel.alternatives[sel.selected];

      // 7. Re-estimate the reservation at the chosen model's cost.
      if (std::fabs(chosen.estimated_cost_usd - admission) > kCostEpsilon) {
        BudgetDecision amended = ledger_->amend(reservation_id, policy, chosen.estimated_cost_usd);
        if (!amended.ok) return deny(amended.error, amended.detail);
        out.budget_status = amended.projected_status;
      }

      // 8. Record
      Decision d;
      d.organization_id = req.organization_id;
      d.unix_ms = ev.unix_ms;
      d.task = req.task;
      d.selected = chosen.ref;
      d.estimated_cost_usd = chosen.estimated_cost_usd;
      d.factors = chosen.factors;
      d.weights = cfg_.weights;
      for (size_t k = 0; k < sel.alternatives.size(); ++k) {
        if (k != sel.selected) d.alternatives.push_back(sel.alternatives[k]);
      }
      d.constraints = {sc.min_perf, sc.max_cost_usd, sc.allowed_providers, sc.preferred_models,
                       sc.force_cheapest};
      if (auto t = telemetry_->model(chosen.ref); t && t->total_requests > 0) {
        d.telemetry = TelemetrySnapshot{t->ewma_latency_ms, t->ewma_error_rate, t->total_requests};
      }
      size_t eligible = 0;
      for (const auto& a : sel.alternatives) eligible += a.rejected ? 0 : 1;
      if (sc.force_cheapest) {
        d.reason = "Forced cheapest (budget " + to_string(out.budget_status) + "): " + chosen.ref.key() +
                   " is the lowest-cost model meeting min performance " + fixed4(sc.min_perf);
      } else {
        d.reason = "Selected " + chosen.ref.key() + " with highest total score " +
                   fixed4(chosen.factors.total_score) + " among " + std::to_string(eligible) +
                   " eligible candidates";
        if (chosen.half_open) d.reason += " (half-open circuit, penalized)";
      }
      d.budget_status = out.budget_status;
      d.reservation_id = reservation_id;
      d = decisions_->record(std::move(d));

      out.decision_id = d.id;
      out.reservation_id = reservation_id;
      out.selected = chosen.ref;
      out.estimated_cost_usd = chosen.estimated_cost_usd;
      out.factors = chosen.factors;
      out.alternatives = d.alternatives;
      out.reason = d.reason;
      if (req.prompt) out.cache_key = cache_key_for(req, chosen.ref);

      std::lock_guard<std::mutex> lk(pending_mu_);
      pending_[reservation_id] =
          Pending{req.organization_id, req.task, chosen.ref, out.cache_key, d.id, *rate_slot};
    }();
  }

  if (out.ok) {
    ev.ok = true;
    ev.decision_id = out.decision_id;
    ev.reservation_id = out.reservation_id;
    ev.provider = out.selected.provider;
    ev.model = out.selected.model;
    ev.cache_hit = out.cache_hit;
    ev.force_cheapest = out.force_cheapest;
    audit("decision", req.organization_id, out.decision_id, ErrorCode::none, out.selected.key(),
          out.estimated_cost_usd, ev.unix_ms);
  }
  ev.estimated_cost_usd = out.estimated_cost_usd;
  emit_router_event(ev);
  return out;
}

OutcomeResult RoutingEngine::report_outcome(const OutcomeReport& report) {
  OutcomeResult out;
  RouterEvent ev;
  ev.kind = "report";
  ev.reservation_id = report.reservation_id;
  ev.unix_ms = clock_->unix_ms();
  ev.latency_ms = report.latency_ms;
  ev.provider_success = report.success && !report.timed_out;

  ScopeTimer timer(ev.duration_ns);

  std::optional<Pending> pending;
  {
    std::lock_guard<std::mutex> lk(pending_mu_);
    auto it = pending_.find(report.reservation_id);
    if (it != pending_.end()) {
      pending = it->second;
      pending_.erase(it);
    }
  }

  const auto reservation = ledger_->find_reservation(report.reservation_id);
  if (!reservation) {
    out.ok = false;
    out.error = ErrorCode::reservation_not_found;
    out.detail = "unknown or already settled reservation " + report.reservation_id;
    ev.ok = false;
    ev.error = out.error;
    emit_router_event(ev);
    return out;
  }

  // Unknown actual cost (timeout, provider did not say): charge the estimate.
  const double actual = report.actual_cost_usd.value_or(reservation->estimated_cost_usd);
  CommitResult committed = ledger_->commit(report.reservation_id, actual);
  if (!committed.ok) {
    out.ok = false;
    out.error = committed.error;
    out.detail = committed.detail;
    ev.ok = false;
    ev.error = out.error;
    emit_router_event(ev);
    return out;
  }

  ModelRef ref = report.ref;
  if (ref.provider.empty() && pending) ref = pending->selected;

  out.organization_id = committed.organization_id;
  out.ref = ref;
  out.charged_usd = committed.charged_usd;
  out.delta_usd = committed.delta_usd;

  if (!ref.provider.empty()) {
    TelemetrySample s;
    s.organization_id = committed.organization_id;
    s.ref = ref;
    s.latency_ms = report.latency_ms;
    s.success = report.success && !report.timed_out;
    s.cost_usd = actual;
    if (pending) s.task = pending->task;
    telemetry_->record(s);
    out.circuit = circuits_->status(ref);

    if (s.success && report.completion && pending && !pending->cache_key.empty() &&
        ref == pending->selected) {
      out.cached = cache_->store(pending->cache_key, ref, *report.completion, actual);
    }
  }

  ev.ok = true;
  ev.organization_id = out.organization_id;
  ev.provider = ref.provider;
  ev.model = ref.model;
  ev.estimated_cost_usd = reservation->estimated_cost_usd;
  ev.actual_cost_usd = actual;
  if (pending) {
    ev.decision_id = pending->decision_id;
    ev.task = to_string(pending->task);
  }
  emit_router_event(ev);
  return out;
}

CommitResult RoutingEngine::cancel(const std::string& reservation_id) {
  std::optional<Pending> pending;
  {
    std::lock_guard<std::mutex> lk(pending_mu_);
    auto it = pending_.find(reservation_id);
    if (it != pending_.end()) {
      pending = it->second;
      pending_.erase(it);
    }
  }
  CommitResult r = ledger_->release(reservation_id);
  if (r.ok && pending) rate_->refund(pending->organization_id, pending->rate);
  return r;
}

PolicyResult RoutingEngine::upsert_policy(const std::string& org_id, const Policy& policy) {
  Policy p = policy;
  p.updated_at_unix_ms = clock_->unix_ms();
  PolicyResult r = policies_->upsert(org_id, std::move(p));
  audit("policy_write", org_id, r.ok ? policy_fingerprint_of(r.policy) : "", r.error,
        r.ok ? "policy stored" : r.detail, 0.0, clock_->unix_ms());
  return r;
}

PolicyResult RoutingEngine::get_policy(const std::string& org_id) const {
  PolicyResult r = policies_->get(org_id);
  if (!r.ok && r.error == ErrorCode::policy_not_found && cfg_.auto_provision_policies) {
    PolicyResult d;
    d.policy = default_policy(org_id, cfg_);
    return d;
  }
  return r;
}

UsageSnapshot RoutingEngine::usage(const std::string& org_id) const {
  Policyish pol = resolve_policy(org_id);
  if (!pol.ok) return ledger_->usage(default_policy(org_id, cfg_));
  return ledger_->usage(pol.policy);
}

size_t RoutingEngine::pending_routes() const {
  std::lock_guard<std::mutex> lk(pending_mu_);
  return pending_.size();
}

}  // namespace routegate
