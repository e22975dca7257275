#include "routegate/observability.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <sstream>

#include "routegate/clock.hpp"
#include "routegate/jsonlite.hpp"

namespace routegate {

namespace {

namespace jl = jsonlite;

// MICRO_OPT: bit_width gives the bucket index in O(1) (BSR/CLZ).
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

}  // namespace

std::string RouterEvent::to_json() const {
  std::ostringstream o;
  o << "{\"kind\":\"" << kind << "\""
    << ",\"timestamp\":\"" << unix_ms_to_iso(unix_ms) << "\""
    << ",\"organization_id\":\"" << jl::escape(organization_id) << "\""
    << ",\"decision_id\":\"" << decision_id << "\""
    << ",\"reservation_id\":\"" << reservation_id << "\""
    << ",\"task\":\"" << task << "\""
    << ",\"provider\":\"" << jl::escape(provider) << "\""
    << ",\"model\":\"" << jl::escape(model) << "\""
    << ",\"ok\":" << (ok ? "true" : "false")
    << ",\"error_code\":\"" << (error == ErrorCode::none ? "" : to_string(error)) << "\""
    << ",\"duration_ns\":" << duration_ns
    << ",\"estimated_cost_usd\":" << jl::format_double(estimated_cost_usd);
  if (kind == "report") {
    o << ",\"actual_cost_usd\":" << jl::format_double(actual_cost_usd)
      << ",\"latency_ms\":" << jl::format_double(latency_ms)
      << ",\"provider_success\":" << (provider_success ? "true" : "false");
  } else {
    o << ",\"cache_hit\":" << (cache_hit ? "true" : "false")
      << ",\"force_cheapest\":" << (force_cheapest ? "true" : "false");
  }
  o << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) counts[i] = buckets_[i].load(std::memory_order_relaxed);

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(256);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_us());
  out += buf;
  const double p50 = percentile(0.50);
  const double p95 = percentile(0.95);
  const double p99 = percentile(0.99);
  out += ",\"p50_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", p50);
  out += buf;
  out += ",\"p95_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", p95);
  out += buf;
  out += ",\"p99_us\":";
  std::snprintf(buf, sizeof(buf), "%.2f", p99);
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// RouterStats
// ---------------------------------------------------------------------------

void RouterStats::record(const RouterEvent& ev) {
  if (ev.kind == "report") {
    if (ev.ok) {
      outcomes_reported.fetch_add(1, std::memory_order_relaxed);
      if (!ev.provider_success) provider_failures.fetch_add(1, std::memory_order_relaxed);
    } else {
      unknown_reservations.fetch_add(1, std::memory_order_relaxed);
    }
  } else {
    route_requests.fetch_add(1, std::memory_order_relaxed);
    route_latency.record(ev.duration_ns);
    if (ev.ok) {
      admitted.fetch_add(1, std::memory_order_relaxed);
      if (ev.cache_hit) cache_hits.fetch_add(1, std::memory_order_relaxed);
      if (ev.force_cheapest) forced_cheapest.fetch_add(1, std::memory_order_relaxed);
    } else {
      denied.fetch_add(1, std::memory_order_relaxed);
      std::lock_guard<std::mutex> lk(denial_mu_);
      denials_.record(ev.error);
    }
  }

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_.size() < kMaxRecentEvents) {
    ring_.push_back(ev);
  } else {
    ring_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
}

DenialStats RouterStats::denial_breakdown() const {
  std::lock_guard<std::mutex> lk(denial_mu_);
  return denials_;
}

std::vector<RouterEvent> RouterStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_.size() < kMaxRecentEvents) return ring_;
  std::vector<RouterEvent> out;
  out.reserve(ring_.size());
  for (size_t i = 0; i < ring_.size(); ++i) out.push_back(ring_[(ring_head_ + i) % ring_.size()]);
  return out;
}

void RouterStats::reset() {
  route_requests.store(0, std::memory_order_relaxed);
  admitted.store(0, std::memory_order_relaxed);
  denied.store(0, std::memory_order_relaxed);
  cache_hits.store(0, std::memory_order_relaxed);
  forced_cheapest.store(0, std::memory_order_relaxed);
  outcomes_reported.store(0, std::memory_order_relaxed);
  provider_failures.store(0, std::memory_order_relaxed);
  unknown_reservations.store(0, std::memory_order_relaxed);
  {
    std::lock_guard<std::mutex> lk(denial_mu_);
    denials_ = DenialStats{};
  }
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_.clear();
  ring_head_ = 0;
}

std::string RouterStats::to_json() const {
  const uint64_t total = route_requests.load(std::memory_order_relaxed);
  const uint64_t hits = cache_hits.load(std::memory_order_relaxed);
  const uint64_t ok = admitted.load(std::memory_order_relaxed);
  char buf[32];

  std::string out;
  out.reserve(768);
  out += "{\"route_requests\":";
  out += std::to_string(total);
  out += ",\"admitted\":";
  out += std::to_string(ok);
  out += ",\"denied\":";
  out += std::to_string(denied.load(std::memory_order_relaxed));
  out += ",\"cache_hits\":";
  out += std::to_string(hits);
  out += ",\"cache_hit_rate\":";
  std::snprintf(buf, sizeof(buf), "%.6f", ok ? static_cast<double>(hits) / static_cast<double>(ok) : 0.0);
  out += buf;
  out += ",\"forced_cheapest\":";
  out += std::to_string(forced_cheapest.load(std::memory_order_relaxed));
  out += ",\"outcomes_reported\":";
  out += std::to_string(outcomes_reported.load(std::memory_order_relaxed));
  out += ",\"provider_failures\":";
  out += std::to_string(provider_failures.load(std::memory_order_relaxed));
  out += ",\"unknown_reservations\":";
  out += std::to_string(unknown_reservations.load(std::memory_order_relaxed));
  out += ",\"route_latency\":";
  out += route_latency.to_json();
  out += ",\"denials\":";
  out += denial_breakdown().to_json();
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

RouterStats& global_router_stats() {
  static RouterStats inst;
  return inst;
}

namespace {
std::atomic<RouterEventHook> g_event_hook{nullptr};
}

void set_router_event_hook(RouterEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_router_event(const RouterEvent& ev) {
  global_router_stats().record(ev);

  RouterEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  const char* log_path = std::getenv("ROUTEGATE_EVENT_LOG");
  if (!log_path || !log_path[0]) return;
  const std::string line = ev.to_json() + "\n";
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace routegate
