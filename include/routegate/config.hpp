#pragma once

// routegate/config.hpp — Engine-wide tunables.
//
// DESIGN:
//   Every threshold the router uses lives in EngineConfig. Nothing is
//   hard-coded at the call site. Layering, lowest to highest precedence:
//     1. EngineConfig::defaults()        documented defaults
//     2. load_engine_config(path, base)  JSON config file (strict)
//     3. EngineConfig::from_env(base)    ROUTEGATE_* environment overrides
//
// ENVIRONMENT:
//   ROUTEGATE_MAX_DAILY_COST        default policy daily ceiling (10.00)
//   ROUTEGATE_MAX_COST_PER_REQUEST  default policy per-request ceiling (0.03)
//   ROUTEGATE_EWMA_ALPHA            telemetry EWMA smoothing (0.3)
//   ROUTEGATE_ENABLE_CACHE          "0" disables the response cache
//   ROUTEGATE_CACHE_TTL_HOURS       cache TTL (24)
//   ROUTEGATE_CACHE_MAX_ENTRIES     cache capacity ceiling (10000)
//   ROUTEGATE_CIRCUIT_COOLDOWN_S    open-circuit cool-down (300)
//   ROUTEGATE_DEVIATION_THRESHOLD   circuit deviation threshold (0.2)
//   ROUTEGATE_ERROR_CEILING         absolute error-rate ceiling (0.3)
//
// INVARIANT:
//   validate() is called by every loader; an EngineConfig that failed
//   validation is never handed to the engine.

#include <cstdint>
#include <string>

#include "routegate/types.hpp"

namespace routegate {

struct ScoringWeights {
  double cost{0.3};
  double latency{0.2};
  double error{0.2};
  double quality{0.3};

  double sum() const { return cost + latency + error + quality; }
};

struct CircuitConfig {
  double   deviation_threshold{0.2};     // |current - baseline| / baseline
  double   error_ceiling{0.3};           // absolute error rate ⇒ critical
  uint64_t cooldown_ms{300000};          // minimum time an open circuit stays open
  uint64_t rolling_window_ms{300000};    // short window for near-real-time health
  uint32_t rolling_max_samples{200};
  uint32_t min_rolling_samples{5};       // below this, no judgement is made
  uint32_t min_baseline_samples{10};     // below this, deviation is not computed
  double   latency_floor_ms{1.0};        // baseline floors keep deviation finite
  double   error_rate_floor{0.01};
};

struct RateConfig {
  uint64_t burst_window_ms{10000};
  uint64_t sustained_window_ms{60000};
};

struct CacheConfig {
  bool     enabled{true};
  uint64_t ttl_ms{24ULL * 3600ULL * 1000ULL};
  uint64_t max_entries{10000};
  uint64_t max_bytes{64ULL * 1024ULL * 1024ULL};
  uint64_t eviction_min_hits{0};          // capacity eviction considers entries with hits >= this
  double   serving_cost_usd{0.0};         // nominal debit for a cache hit
  uint64_t compress_threshold_bytes{4096};
  double   default_temperature{0.7};
  uint64_t default_max_tokens{2000};
};

struct TelemetryConfig {
  double   ewma_alpha{0.3};
  uint32_t hourly_retention_hours{48};
  uint32_t daily_retention_days{30};
  uint64_t stale_after_ms{24ULL * 3600ULL * 1000ULL};
};

struct AdaptationConfig {
  double   min_alpha{0.1};
  double   max_alpha{0.5};
  double   target_variance{0.1};
  double   alpha_step{0.05};
  uint32_t min_requests_for_alpha{10};
  double   disable_error_threshold{0.5};
  uint32_t min_requests_before_disable{10};
  double   recovery_error_threshold{0.2};
  uint32_t min_requests_before_enable{5};
};

struct EngineConfig {
  ScoringWeights   weights;
  double           warning_penalty{0.5};   // totalScore multiplier for half-open models
  CircuitConfig    circuit;
  RateConfig       rate;
  CacheConfig      cache;
  TelemetryConfig  telemetry;
  AdaptationConfig adaptation;

  double   default_max_daily_cost_usd{10.00};
  double   default_max_request_cost_usd{0.03};
  uint32_t decision_retention_per_org{1000};
  // Route for an organization with no stored policy using default_policy()
  // instead of failing with policy_not_found.
  bool     auto_provision_policies{false};

  static EngineConfig defaults();

  // Overlay ROUTEGATE_* variables on `base`. Malformed values are ignored
  // (the base value stays) and reported through `warnings` when non-null.
  static EngineConfig from_env(const EngineConfig& base, std::string* warnings = nullptr);

  std::string to_json() const;
};

struct ConfigResult {
  bool         ok{true};
  ErrorCode    error{ErrorCode::none};
  std::string  detail;
  EngineConfig config;

  std::string to_json() const;
};

ConfigResult validate_config(const EngineConfig& cfg);

// Strict JSON parse of a config file; unknown keys are ignored, duplicate
// keys and out-of-range values are config_invalid / json_duplicate_key.
ConfigResult load_engine_config(const std::string& path, const EngineConfig& base);
ConfigResult engine_config_from_json(const std::string& text, const EngineConfig& base);

}  // namespace routegate
