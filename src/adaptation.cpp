#include "routegate/adaptation.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "routegate/audit.hpp"
#include "routegate/clock.hpp"
#include "routegate/decision_engine.hpp"
#include "routegate/jsonlite.hpp"

namespace routegate {

namespace {

namespace jl = jsonlite;

std::string join(const std::vector<std::string>& v) {
  std::string out;
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) out += ",";
    out += v[i];
  }
  return out;
}

std::string fixed(double d, int places) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.*f", places, d);
  return buf;
}

}  // namespace

std::string to_string(AdaptationKind k) {
  switch (k) {
    case AdaptationKind::tune_alpha: return "tune_alpha";
    case AdaptationKind::disable_provider: return "disable_provider";
    case AdaptationKind::enable_provider: return "enable_provider";
  }
  return "tune_alpha";
}

std::string AdaptationEvent::to_json() const {
  std::ostringstream o;
  o << "{\"timestamp\":\"" << unix_ms_to_iso(timestamp_unix_ms) << "\""
    << ",\"kind\":\"" << to_string(kind) << "\""
    << ",\"organization_id\":\"" << jl::escape(organization_id) << "\""
    << ",\"subject\":\"" << jl::escape(subject) << "\""
    << ",\"before\":\"" << jl::escape(before) << "\""
    << ",\"after\":\"" << jl::escape(after) << "\""
    << ",\"rationale\":\"" << jl::escape(rationale) << "\""
    << ",\"applied\":" << (applied ? "true" : "false");
  if (!block_reason.empty()) o << ",\"block_reason\":\"" << jl::escape(block_reason) << "\"";
  o << "}";
  return o.str();
}

double ProviderHealth::error_rate() const {
  return requests ? static_cast<double>(errors) / static_cast<double>(requests) : 0.0;
}

double ProviderHealth::recent_error_rate() const {
  return recent_requests ? static_cast<double>(recent_errors) / static_cast<double>(recent_requests)
                         : 0.0;
}

// ---------------------------------------------------------------------------
// AdaptationEngine
// ---------------------------------------------------------------------------

AdaptationEngine::AdaptationEngine(AdaptationConfig cfg, RoutingEngine& engine)
    : cfg_(cfg), engine_(engine) {
  events_.reserve(kMaxEvents);
}

std::vector<ProviderHealth> AdaptationEngine::provider_health() const {
  std::map<std::string, ProviderHealth> acc;
  for (const auto& m : engine_.telemetry().models()) {
    ProviderHealth& h = acc[m.ref.provider];
    h.provider = m.ref.provider;
    h.requests += m.rolling.samples + m.baseline.samples;
    h.errors += m.rolling.errors + m.baseline.errors;
    h.recent_requests += m.rolling.samples;
    h.recent_errors += m.rolling.errors;
  }
  std::vector<ProviderHealth> out;
  out.reserve(acc.size());
  for (auto& [name, h] : acc) out.push_back(h);
  return out;
}

std::vector<AdaptationEvent> AdaptationEngine::tune_alphas() {
  std::vector<AdaptationEvent> out;
  TelemetryAggregator& telemetry = engine_.telemetry();
  const uint64_t now = engine_.clock().unix_ms();

  for (const auto& m : telemetry.models()) {
    if (m.total_requests < cfg_.min_requests_for_alpha) continue;
    const double variance = m.ewma_error_rate * (1.0 - m.ewma_error_rate);
    double next = m.alpha;
    std::string why;
    if (variance > cfg_.target_variance) {
      next = std::min(cfg_.max_alpha, m.alpha + cfg_.alpha_step);
      why = "error variance " + fixed(variance, 4) + " above target; react faster";
    } else if (variance < cfg_.target_variance / 2.0) {
      next = std::max(cfg_.min_alpha, m.alpha - cfg_.alpha_step);
      why = "error variance " + fixed(variance, 4) + " below half target; smooth more";
    }
    if (std::abs(next - m.alpha) < 1e-9) continue;

    telemetry.set_alpha(m.ref, next);
    AdaptationEvent ev;
    ev.timestamp_unix_ms = now;
    ev.kind = AdaptationKind::tune_alpha;
    ev.subject = m.ref.key();
    ev.before = fixed(m.alpha, 2);
    ev.after = fixed(telemetry.alpha(m.ref), 2);
    ev.rationale = why;
    ev.applied = true;
    out.push_back(ev);
  }
  return out;
}

std::vector<AdaptationEvent> AdaptationEngine::adapt_providers(const std::string& org_id,
                                                               const std::vector<ProviderHealth>& health) {
  std::vector<AdaptationEvent> out;
  PolicyResult stored = engine_.policies().get_stored(org_id);
  if (!stored.ok) return out;

  Policy policy = stored.policy;
  const uint64_t now = engine_.clock().unix_ms();
  std::set<std::string> disabled;
  {
    std::lock_guard<std::mutex> lk(mu_);
    disabled = disabled_[org_id];
  }

  bool changed = false;
  for (const auto& h : health) {
    const bool allowed = policy.allows_provider(h.provider);

    if (allowed && h.requests >= cfg_.min_requests_before_disable &&
        h.error_rate() > cfg_.disable_error_threshold) {
      AdaptationEvent ev;
      ev.timestamp_unix_ms = now;
      ev.kind = AdaptationKind::disable_provider;
      ev.organization_id = org_id;
      ev.subject = h.provider;
      ev.before = join(policy.allowed_providers);
      ev.rationale = "error rate " + fixed(h.error_rate(), 3) + " over " + std::to_string(h.requests) +
                     " requests exceeds " + fixed(cfg_.disable_error_threshold, 2);
      if (policy.allowed_providers.size() <= 1) {
        ev.after = ev.before;
        ev.applied = false;
        ev.block_reason = "last allowed provider";
      } else {
        auto& ap = policy.allowed_providers;
        ap.erase(std::remove(ap.begin(), ap.end(), h.provider), ap.end());
        ev.after = join(ap);
        ev.applied = true;
        disabled.insert(h.provider);
        changed = true;
      }
      out.push_back(ev);
    } else if (!allowed && disabled.count(h.provider) &&
               h.recent_requests >= cfg_.min_requests_before_enable &&
               h.recent_error_rate() < cfg_.recovery_error_threshold) {
      AdaptationEvent ev;
      ev.timestamp_unix_ms = now;
      ev.kind = AdaptationKind::enable_provider;
      ev.organization_id = org_id;
      ev.subject = h.provider;
      ev.before = join(policy.allowed_providers);
      policy.allowed_providers.push_back(h.provider);
      ev.after = join(policy.allowed_providers);
      ev.rationale = "recent error rate " + fixed(h.recent_error_rate(), 3) + " recovered below " +
                     fixed(cfg_.recovery_error_threshold, 2);
      ev.applied = true;
      disabled.erase(h.provider);
      changed = true;
      out.push_back(ev);
    }
  }

  if (changed) {
    PolicyResult written = engine_.upsert_policy(org_id, policy);
    if (!written.ok) {
      for (auto& ev : out) {
        if (!ev.applied) continue;
        ev.applied = false;
        ev.block_reason = "policy write failed: " + written.detail;
      }
      return out;
    }
    std::lock_guard<std::mutex> lk(mu_);
    disabled_[org_id] = disabled;
  }
  return out;
}

std::vector<AdaptationEvent> AdaptationEngine::tick(const std::vector<std::string>& org_ids) {
  std::vector<AdaptationEvent> out = tune_alphas();
  const auto health = provider_health();
  for (const auto& org : org_ids) {
    auto evs = adapt_providers(org, health);
    out.insert(out.end(), evs.begin(), evs.end());
  }
  for (const auto& ev : out) push_event(ev);
  return out;
}

std::vector<AdaptationEvent> AdaptationEngine::tick(const std::string& org_id) {
  return tick(std::vector<std::string>{org_id});
}

std::set<std::string> AdaptationEngine::disabled_providers(const std::string& org_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = disabled_.find(org_id);
  return it == disabled_.end() ? std::set<std::string>{} : it->second;
}

void AdaptationEngine::push_event(const AdaptationEvent& ev) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (events_.size() < kMaxEvents) {
      events_.push_back(ev);
    } else {
      events_[event_head_] = ev;
    }
    event_head_ = (event_head_ + 1) % kMaxEvents;
    ++event_count_;
  }
  emit_adaptation_event(ev);

  AuditRecord rec;
  rec.kind = "adaptation";
  rec.organization_id = ev.organization_id;
  rec.subject = to_string(ev.kind) + ":" + ev.subject;
  rec.detail = ev.applied ? ev.rationale : ev.rationale + "; blocked: " + ev.block_reason;
  rec.engine_semver = PROJECT_VERSION;
  rec.timestamp_unix_ms = ev.timestamp_unix_ms;
  global_audit_log().append(rec);
}

std::vector<AdaptationEvent> AdaptationEngine::recent_events() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (events_.size() < kMaxEvents) return events_;
  std::vector<AdaptationEvent> out;
  out.reserve(events_.size());
  for (size_t i = 0; i < events_.size(); ++i) out.push_back(events_[(event_head_ + i) % events_.size()]);
  return out;
}

uint64_t AdaptationEngine::event_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return event_count_;
}

void emit_adaptation_event(const AdaptationEvent& ev) {
  const char* log_path = std::getenv("ROUTEGATE_ADAPTATION_LOG");
  if (!log_path || !log_path[0]) return;
  const std::string line = ev.to_json() + "\n";
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace routegate
