#pragma once

// routegate/circuit_breaker.hpp — Health state per provider/model, derived from telemetry.
//
// CLASSIFICATION (assess_health):
//   deviation = |current - baseline| / baseline, per dimension (latency,
//   error rate), current = rolling window, baseline = the rest of the 24 h log.
//     healthy   both deviations <= threshold (0.2)
//     warning   exactly one deviation above threshold        (half-open)
//     critical  both above threshold, or current error rate
//               above the absolute ceiling (0.3)               (open)
//   Fewer than min_rolling_samples recent samples ⇒ no judgement (healthy).
//   Fewer than min_baseline_samples baseline samples ⇒ only the absolute
//   ceiling applies. Baselines are floored (1 ms, 1 %) so deviation stays
//   finite.
//
// STATE MACHINE (CircuitBreaker::evaluate):
//   healthy/warning → whatever assess_health says, immediately.
//   critical → stays critical until BOTH:
//     a) cooldown_ms has elapsed on the monotonic clock since opening, and
//     b) at least min_rolling_samples samples recorded after opening assess
//        as non-critical.
//   There is no instant recovery; a fresh window has to earn it.
//
// EVENTS:
//   Every status change is a CircuitEvent, kept in a bounded ring buffer and
//   appended as JSONL to ROUTEGATE_CIRCUIT_LOG when set.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "routegate/clock.hpp"
#include "routegate/config.hpp"
#include "routegate/telemetry.hpp"
#include "routegate/types.hpp"

namespace routegate {

enum class CircuitStatus { healthy, warning, critical };

// "healthy" | "warning" | "critical"
std::string to_string(CircuitStatus s);
// "closed" | "half-open" | "open"
std::string circuit_position(CircuitStatus s);

struct HealthAssessment {
  ModelRef      ref;
  CircuitStatus status{CircuitStatus::healthy};
  double        current_latency_ms{0.0};
  double        baseline_latency_ms{0.0};
  double        latency_deviation{0.0};
  double        current_error_rate{0.0};
  double        baseline_error_rate{0.0};
  double        error_deviation{0.0};
  uint64_t      rolling_samples{0};
  uint64_t      baseline_samples{0};
  std::vector<std::string> recommendations;

  std::string to_json() const;
};

HealthAssessment assess_health(const ModelRef& ref, const WindowStats& current,
                               const WindowStats& baseline, const CircuitConfig& cfg);

struct CircuitState {
  ModelRef         ref;
  CircuitStatus    status{CircuitStatus::healthy};
  HealthAssessment last;
  uint64_t         opened_at_unix_ms{0};
  uint64_t         opened_at_mono_ms{0};
  uint64_t         last_transition_unix_ms{0};
  uint32_t         trips{0};

  std::string to_json() const;
};

struct CircuitEvent {
  uint64_t      seq{0};
  uint64_t      unix_ms{0};
  ModelRef      ref;
  CircuitStatus from{CircuitStatus::healthy};
  CircuitStatus to{CircuitStatus::healthy};
  std::string   reason;

  std::string to_json() const;
};

class CircuitBreaker {
 public:
  CircuitBreaker(CircuitConfig cfg, std::shared_ptr<const TelemetryAggregator> telemetry,
                 std::shared_ptr<Clock> clock = nullptr);

  // Re-assesses the model and applies the state machine.
  CircuitState evaluate(const ModelRef& ref);

  CircuitStatus status(const ModelRef& ref) { return evaluate(ref).status; }

  // Evaluates every model that has telemetry or circuit state.
  std::vector<CircuitState> states();

  // Sorted critical → warning → healthy, then by provider/model.
  std::vector<HealthAssessment> health_report();

  // Operator override: close the circuit and forget the trip.
  void reset(const ModelRef& ref);

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<CircuitEvent> recent_events() const;

 private:
  void transition(CircuitState& st, CircuitStatus to, const std::string& reason, uint64_t now_unix);

  CircuitConfig cfg_;
  std::shared_ptr<const TelemetryAggregator> telemetry_;
  std::shared_ptr<Clock> clock_;
  mutable std::mutex mu_;
  std::map<std::string, CircuitState> states_;
  std::vector<CircuitEvent> ring_;
  size_t ring_head_{0};
  uint64_t event_seq_{0};
};

// Appends to ROUTEGATE_CIRCUIT_LOG when set. Never blocks routing on failure.
void emit_circuit_event(const CircuitEvent& ev);

}  // namespace routegate
