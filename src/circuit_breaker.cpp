#include "routegate/circuit_breaker.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <set>
#include <sstream>

#include "routegate/jsonlite.hpp"

namespace routegate {

namespace {

namespace jl = jsonlite;

std::string fd(double d) { return jl::format_double(d); }

std::string pct(double ratio) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.0f%%", ratio * 100.0);
  return buf;
}

int severity_rank(CircuitStatus s) {
  switch (s) {
    case CircuitStatus::critical: return 0;
    case CircuitStatus::warning: return 1;
    case CircuitStatus::healthy: return 2;
  }
  return 2;
}

}  // namespace

std::string to_string(CircuitStatus s) {
  switch (s) {
    case CircuitStatus::healthy: return "healthy";
    case CircuitStatus::warning: return "warning";
    case CircuitStatus::critical: return "critical";
  }
  return "healthy";
}

std::string circuit_position(CircuitStatus s) {
  switch (s) {
    case CircuitStatus::healthy: return "closed";
    case CircuitStatus::warning: return "half-open";
    case CircuitStatus::critical: return "open";
  }
  return "closed";
}

std::string HealthAssessment::to_json() const {
  std::ostringstream o;
  o << "{\"provider\":\"" << jl::escape(ref.provider) << "\""
    << ",\"model\":\"" << jl::escape(ref.model) << "\""
    << ",\"status\":\"" << to_string(status) << "\""
    << ",\"circuit\":\"" << circuit_position(status) << "\""
    << ",\"current_latency_ms\":" << fd(current_latency_ms)
    << ",\"baseline_latency_ms\":" << fd(baseline_latency_ms)
    << ",\"latency_deviation\":" << fd(latency_deviation)
    << ",\"current_error_rate\":" << fd(current_error_rate)
    << ",\"baseline_error_rate\":" << fd(baseline_error_rate)
    << ",\"error_deviation\":" << fd(error_deviation)
    << ",\"rolling_samples\":" << rolling_samples
    << ",\"baseline_samples\":" << baseline_samples
    << ",\"recommendations\":[";
  for (size_t i = 0; i < recommendations.size(); ++i) {
    if (i) o << ",";
    o << "\"" << jl::escape(recommendations[i]) << "\"";
  }
  o << "]}";
  return o.str();
}

HealthAssessment assess_health(const ModelRef& ref, const WindowStats& current,
                               const WindowStats& baseline, const CircuitConfig& cfg) {
  HealthAssessment a;
  a.ref = ref;
  a.current_latency_ms = current.avg_latency_ms;
  a.current_error_rate = current.error_rate;
  a.baseline_latency_ms = baseline.avg_latency_ms;
  a.baseline_error_rate = baseline.error_rate;
  a.rolling_samples = current.samples;
  a.baseline_samples = baseline.samples;

  if (current.samples < cfg.min_rolling_samples) {
    a.recommendations.emplace_back("Insufficient recent samples for health evaluation");
    return a;
  }

  const bool over_ceiling = current.error_rate > cfg.error_ceiling;

  if (baseline.samples < cfg.min_baseline_samples) {
    if (over_ceiling) {
      a.status = CircuitStatus::critical;
      a.recommendations.push_back("Error rate " + pct(current.error_rate) +
                                  " exceeds absolute ceiling; circuit open");
    } else {
      a.recommendations.emplace_back("Insufficient historical data for baseline comparison");
    }
    return a;
  }

  const double base_latency = std::max(baseline.avg_latency_ms, cfg.latency_floor_ms);
  const double base_error = std::max(baseline.error_rate, cfg.error_rate_floor);
  a.latency_deviation = std::fabs(current.avg_latency_ms - base_latency) / base_latency;
  a.error_deviation = std::fabs(current.error_rate - base_error) / base_error;

  const bool latency_off = a.latency_deviation > cfg.deviation_threshold;
  const bool error_off = a.error_deviation > cfg.deviation_threshold;

  if (over_ceiling || (latency_off && error_off)) {
    a.status = CircuitStatus::critical;
  } else if (latency_off || error_off) {
    a.status = CircuitStatus::warning;
  }

  if (over_ceiling) {
    a.recommendations.push_back("Error rate " + pct(current.error_rate) +
                                " exceeds absolute ceiling; circuit open");
  }
  if (error_off) {
    a.recommendations.push_back("Error rate " + pct(a.error_deviation) +
                                (current.error_rate > base_error ? " above" : " below") + " baseline");
  }
  if (latency_off) {
    a.recommendations.push_back("Latency " + pct(a.latency_deviation) +
                                (current.avg_latency_ms > base_latency ? " above" : " below") +
                                " baseline");
  }
  if (a.status == CircuitStatus::healthy) a.recommendations.emplace_back("All metrics within normal range");
  return a;
}

std::string CircuitState::to_json() const {
  std::ostringstream o;
  o << "{\"provider\":\"" << jl::escape(ref.provider) << "\""
    << ",\"model\":\"" << jl::escape(ref.model) << "\""
    << ",\"status\":\"" << to_string(status) << "\""
    << ",\"circuit\":\"" << circuit_position(status) << "\""
    << ",\"trips\":" << trips;
  if (status == CircuitStatus::critical) {
    o << ",\"opened_at\":\"" << unix_ms_to_iso(opened_at_unix_ms) << "\"";
  }
  o << ",\"assessment\":" << last.to_json() << "}";
  return o.str();
}

std::string CircuitEvent::to_json() const {
  std::ostringstream o;
  o << "{\"seq\":" << seq
    << ",\"timestamp\":\"" << unix_ms_to_iso(unix_ms) << "\""
    << ",\"provider\":\"" << jl::escape(ref.provider) << "\""
    << ",\"model\":\"" << jl::escape(ref.model) << "\""
    << ",\"from\":\"" << to_string(from) << "\""
    << ",\"to\":\"" << to_string(to) << "\""
    << ",\"reason\":\"" << jl::escape(reason) << "\"}";
  return o.str();
}

// ---------------------------------------------------------------------------
// CircuitBreaker
// ---------------------------------------------------------------------------

CircuitBreaker::CircuitBreaker(CircuitConfig cfg, std::shared_ptr<const TelemetryAggregator> telemetry,
                               std::shared_ptr<Clock> clock)
    : cfg_(cfg), telemetry_(std::move(telemetry)), clock_(clock ? std::move(clock) : system_clock()) {
  ring_.reserve(kMaxRecentEvents);
}

void CircuitBreaker::transition(CircuitState& st, CircuitStatus to, const std::string& reason,
                                uint64_t now_unix) {
  CircuitEvent ev;
  ev.seq = ++event_seq_;
  ev.unix_ms = now_unix;
  ev.ref = st.ref;
  ev.from = st.status;
  ev.to = to;
  ev.reason = reason;

  st.status = to;
  st.last_transition_unix_ms = now_unix;

  if (ring_.size() < kMaxRecentEvents) {
    ring_.push_back(ev);
  } else {
    ring_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
  emit_circuit_event(ev);
}

CircuitState CircuitBreaker::evaluate(const ModelRef& ref) {
  const auto snap = telemetry_->model(ref);
  const uint64_t now_unix = clock_->unix_ms();
  const uint64_t now_mono = clock_->monotonic_ms();

  HealthAssessment a;
  if (snap) {
    a = assess_health(ref, snap->rolling, snap->baseline, cfg_);
  } else {
    a.ref = ref;
    a.recommendations.emplace_back("No telemetry recorded");
  }

  std::lock_guard<std::mutex> lk(mu_);
  auto [it, inserted] = states_.try_emplace(ref.key());
  CircuitState& st = it->second;
  if (inserted) st.ref = ref;

  if (st.status != CircuitStatus::critical) {
    st.last = a;
    if (a.status != st.status) {
      if (a.status == CircuitStatus::critical) {
        st.opened_at_unix_ms = now_unix;
        st.opened_at_mono_ms = now_mono;
        ++st.trips;
      }
      const std::string reason =
          a.recommendations.empty() ? to_string(a.status) : a.recommendations.front();
      transition(st, a.status, reason, now_unix);
    }
    return st;
  }

  // Open circuit: hold through the cool-down, then require a fresh window.
  st.last = a;
  st.last.status = CircuitStatus::critical;
  if (now_mono < st.opened_at_mono_ms + cfg_.cooldown_ms || !snap) return st;

  const WindowStats fresh = telemetry_->rolling_since(ref, st.opened_at_unix_ms + 1);
  if (fresh.samples < cfg_.min_rolling_samples) {
    st.last.recommendations.emplace_back("Cool-down elapsed; awaiting fresh samples");
    return st;
  }
  HealthAssessment recovered = assess_health(ref, fresh, snap->baseline, cfg_);
  if (recovered.status == CircuitStatus::critical) {
    st.last = recovered;
    return st;
  }
  st.last = recovered;
  transition(st, recovered.status, "recovered after cool-down", now_unix);
  return st;
}

std::vector<CircuitState> CircuitBreaker::states() {
  std::set<ModelRef> refs;
  for (const auto& m : telemetry_->models()) refs.insert(m.ref);
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [key, st] : states_) refs.insert(st.ref);
  }
  std::vector<CircuitState> out;
  out.reserve(refs.size());
  for (const auto& ref : refs) out.push_back(evaluate(ref));
  return out;
}

std::vector<HealthAssessment> CircuitBreaker::health_report() {
  std::vector<HealthAssessment> out;
  for (const auto& st : states()) out.push_back(st.last);
  std::stable_sort(out.begin(), out.end(), [](const HealthAssessment& a, const HealthAssessment& b) {
    return severity_rank(a.status) < severity_rank(b.status);
  });
  return out;
}

void CircuitBreaker::reset(const ModelRef& ref) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = states_.find(ref.key());
  if (it == states_.end()) return;
  if (it->second.status != CircuitStatus::healthy) {
    transition(it->second, CircuitStatus::healthy, "operator reset", clock_->unix_ms());
  }
  it->second.opened_at_unix_ms = 0;
  it->second.opened_at_mono_ms = 0;
}

std::vector<CircuitEvent> CircuitBreaker::recent_events() const {
  std::lock_guard<std::mutex> lk(mu_);
  if (ring_.size() < kMaxRecentEvents) return ring_;
  std::vector<CircuitEvent> out;
  out.reserve(ring_.size());
  for (size_t i = 0; i < ring_.size(); ++i) out.push_back(ring_[(ring_head_ + i) % ring_.size()]);
  return out;
}

void emit_circuit_event(const CircuitEvent& ev) {
  const char* log_path = std::getenv("ROUTEGATE_CIRCUIT_LOG");
  if (!log_path || !log_path[0]) return;
  const std::string line = ev.to_json() + "\n";
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace routegate
