#pragma once

// routegate/observability.hpp — Structured router observability layer.
//
// DESIGN:
//   RouterEvent is the canonical observable unit. Every route_request() and
//   report_outcome() call emits exactly one RouterEvent, denials included.
//   Each event is:
//     - recorded into global_router_stats() (atomic counters, latency
//       histogram, bounded ring of recent events);
//     - handed to the registered hook if one is set, otherwise appended as one
//       JSON line to ROUTEGATE_EVENT_LOG when that variable is set.
//
// EXTENSION_POINT: OpenTelemetry_exporter
//   Register a hook with set_router_event_hook() that converts RouterEvent into
//   spans. Invariant: event emission must NEVER block route_request(). Prompts
//   and completions are never part of an event; only ids, costs and metadata.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "routegate/types.hpp"

namespace routegate {

// ---------------------------------------------------------------------------
// RouterEvent — per-call observable unit
// ---------------------------------------------------------------------------
struct RouterEvent {
  std::string kind;              // "route" | "report"
  std::string organization_id;
  std::string decision_id;       // empty for denials
  std::string reservation_id;
  std::string task;              // wire name
  std::string provider;
  std::string model;

  uint64_t unix_ms{0};
  uint64_t duration_ns{0};       // wall-clock of the call

  double estimated_cost_usd{0.0};
  double actual_cost_usd{0.0};
  double latency_ms{0.0};        // provider latency (report only)

  bool cache_hit{false};
  bool force_cheapest{false};
  bool provider_success{true};   // report only

  bool ok{false};
  ErrorCode error{ErrorCode::none};

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0,1]. 0.0 when empty.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
  // MICRO_DOCUMENTED: buckets_ and the totals sit on separate cache lines so
  // concurrent route_request() calls do not bounce one line between cores.
};

// ---------------------------------------------------------------------------
// RouterStats — process-wide aggregated statistics
// ---------------------------------------------------------------------------
// Thread-safe. Counters are atomic; denial breakdown and the ring use mutexes.
// Exposed via `routegate health`.
class RouterStats {
 public:
  void record(const RouterEvent& ev);
  std::string to_json() const;

  alignas(64) std::atomic<uint64_t> route_requests{0};
  alignas(64) std::atomic<uint64_t> admitted{0};
  alignas(64) std::atomic<uint64_t> denied{0};
  alignas(64) std::atomic<uint64_t> cache_hits{0};
  alignas(64) std::atomic<uint64_t> forced_cheapest{0};
  alignas(64) std::atomic<uint64_t> outcomes_reported{0};
  alignas(64) std::atomic<uint64_t> provider_failures{0};
  alignas(64) std::atomic<uint64_t> unknown_reservations{0};

  DenialStats denial_breakdown() const;

  LatencyHistogram route_latency;

  // MICRO_OPT: O(1) circular buffer. ring_head_ is the next slot to overwrite
  // (the oldest entry once full). ring_.size() <= kMaxRecentEvents always.
  static constexpr size_t kMaxRecentEvents = 1000;
  std::vector<RouterEvent> recent_events_snapshot() const;

  void reset();

 private:
  mutable std::mutex denial_mu_;
  DenialStats denials_;

  mutable std::mutex ring_mu_;
  std::vector<RouterEvent> ring_;
  size_t ring_head_{0};
};

RouterStats& global_router_stats();

// Records the event and forwards it to the hook or ROUTEGATE_EVENT_LOG.
void emit_router_event(const RouterEvent& ev);

using RouterEventHook = void (*)(const RouterEvent&);
void set_router_event_hook(RouterEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    using NS = std::chrono::nanoseconds;
    out_ns = static_cast<uint64_t>(std::chrono::duration_cast<NS>(Clock::now() - start).count());
  }
};

}  // namespace routegate
