#pragma once

// routegate/adaptation.hpp — Telemetry-driven policy adaptation loop.
//
// DESIGN:
//   AdaptationEngine observes per-model telemetry and adjusts two things:
//     - the EWMA smoothing factor of each model (global);
//     - an organization's allowed_providers (per organization).
//
//   It MUST NOT:
//     - loosen any budget, rate or token guardrail;
//     - remove the last allowed provider of an organization;
//     - operate silently: every action, applied or blocked, is an
//       AdaptationEvent in the ring buffer and on ROUTEGATE_ADAPTATION_LOG.
//
// FEEDBACK LOOP (tick):
//   1. Observe   TelemetryAggregator::models(), 24 h window per model.
//   2. Alpha     variance proxy v = e * (1 - e) of the EWMA error rate e.
//                v > target_variance        → alpha += step (max_alpha)
//                v < target_variance / 2    → alpha -= step (min_alpha)
//                Needs min_requests_for_alpha requests.
//   3. Disable   provider error rate > disable_error_threshold with at least
//                min_requests_before_disable requests → removed from the
//                organization's allowed_providers.
//   4. Enable    a provider this engine disabled whose rolling-window error
//                rate fell below recovery_error_threshold with at least
//                min_requests_before_enable recent requests → restored. The
//                24 h rate would keep the old failures for a day.
//   5. Apply     policy changes go through RoutingEngine::upsert_policy, so
//                they are validated and audited like any other write.
//
// EXTENSION_POINT: ml_adaptation_policy
//   Replace the thresholds in adapt_providers() with a learned model. The
//   event schema and the guardrails stay.

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "routegate/config.hpp"

namespace routegate {

class RoutingEngine;

enum class AdaptationKind { tune_alpha, disable_provider, enable_provider };

std::string to_string(AdaptationKind k);

struct AdaptationEvent {
  uint64_t       timestamp_unix_ms{0};
  AdaptationKind kind{AdaptationKind::tune_alpha};
  std::string    organization_id;   // empty for tune_alpha
  std::string    subject;           // "provider:model" or provider
  std::string    before;
  std::string    after;
  std::string    rationale;
  bool           applied{false};
  std::string    block_reason;      // non-empty if !applied

  std::string to_json() const;
};

struct ProviderHealth {
  std::string provider;
  uint64_t    requests{0};          // 24 h
  uint64_t    errors{0};
  uint64_t    recent_requests{0};   // rolling window
  uint64_t    recent_errors{0};

  double error_rate() const;
  double recent_error_rate() const;
};

class AdaptationEngine {
 public:
  AdaptationEngine(AdaptationConfig cfg, RoutingEngine& engine);

  // Runs the alpha pass and, for each organization, the provider pass.
  // Returns the events produced by this tick.
  std::vector<AdaptationEvent> tick(const std::vector<std::string>& org_ids);
  std::vector<AdaptationEvent> tick(const std::string& org_id);

  // Request/error totals per provider over 24 h and the rolling window.
  std::vector<ProviderHealth> provider_health() const;

  std::set<std::string> disabled_providers(const std::string& org_id) const;

  static constexpr size_t kMaxEvents = 256;
  std::vector<AdaptationEvent> recent_events() const;
  uint64_t event_count() const;

 private:
  std::vector<AdaptationEvent> tune_alphas();
  std::vector<AdaptationEvent> adapt_providers(const std::string& org_id,
                                               const std::vector<ProviderHealth>& health);
  void push_event(const AdaptationEvent& ev);

  AdaptationConfig cfg_;
  RoutingEngine& engine_;
  mutable std::mutex mu_;
  std::map<std::string, std::set<std::string>> disabled_;   // org -> providers we removed
  std::vector<AdaptationEvent> events_;
  size_t event_head_{0};
  uint64_t event_count_{0};
};

// Appends to ROUTEGATE_ADAPTATION_LOG when set.
void emit_adaptation_event(const AdaptationEvent& ev);

}  // namespace routegate
