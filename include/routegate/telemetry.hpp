#pragma once

// routegate/telemetry.hpp — Rolling per-provider/model statistics.
//
// DESIGN:
//   One ModelSeries per provider:model. Each TelemetrySample updates:
//     - an EWMA of latency and error rate (alpha per model, default 0.3),
//       used by scoring;
//     - a 24 h sample log. Its tail (last 5 min, at most 200 samples) is the
//       rolling window used for near-real-time health; the rest of the log is
//       the baseline the circuit breaker compares against;
//     - hourly buckets (48 h kept) and daily buckets (30 d kept).
//
// INVARIANTS:
//   1. CLOSED BUCKETS ARE IMMUTABLE: a sample that belongs to a bucket older
//      than the newest open bucket is counted into the newest bucket.
//   2. ROLLING ⊂ LOG, BASELINE = LOG \ ROLLING: the two windows never share a
//      sample, so a burst of failures cannot drag its own baseline along.
//   3. Readers get value snapshots; nothing returned aliases internal state.
//
// CONCURRENCY:
//   A single mutex guards all series. Telemetry reads are allowed to be
//   slightly stale relative to in-flight records.
//
// EXTENSION_POINT: persisted_aggregates
//   Closed hourly/daily buckets are the natural rows of a `telemetry_aggregates`
//   table (provider, model, period, period_start). Persisting them at close
//   time gives restart-safe baselines without replaying samples.

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "routegate/clock.hpp"
#include "routegate/config.hpp"
#include "routegate/types.hpp"

namespace routegate {

struct TelemetrySample {
  std::string organization_id;
  ModelRef    ref;
  uint64_t    unix_ms{0};            // 0 = stamp with the aggregator's clock
  double      latency_ms{0.0};
  bool        success{true};
  double      cost_usd{0.0};
  std::optional<TaskCategory> task;
};

// Sums over a set of samples or buckets.
struct AggregatedMetric {
  ModelRef ref;
  uint64_t period_start_ms{0};
  uint64_t period_ms{0};
  uint64_t total_requests{0};
  uint64_t errors{0};
  double   latency_sum_ms{0.0};
  double   cost_sum_usd{0.0};

  void add(const AggregatedMetric& o);
  double avg_latency_ms() const;
  double error_rate() const;
  double success_rate() const;
  double avg_cost_per_request() const;

  std::string to_json() const;
};

struct WindowStats {
  uint64_t samples{0};
  uint64_t errors{0};
  double   avg_latency_ms{0.0};
  double   error_rate{0.0};
  double   cost_usd{0.0};
};

struct ModelTelemetry {
  ModelRef    ref;
  double      alpha{0.3};
  double      ewma_latency_ms{0.0};
  double      ewma_error_rate{0.0};
  uint64_t    total_requests{0};
  uint64_t    total_errors{0};
  double      total_cost_usd{0.0};
  uint64_t    last_sample_unix_ms{0};
  WindowStats rolling;
  WindowStats baseline;

  std::string to_json() const;
};

enum class SummaryPeriod { last_hour, last_day, last_week, last_month };
enum class Trend { increasing, stable, decreasing };

std::string to_string(SummaryPeriod p);
std::string to_string(Trend t);
std::optional<SummaryPeriod> parse_summary_period(const std::string& s);   // "1h","24h","7d","30d"
uint64_t period_ms(SummaryPeriod p);

// first == 0 or second == 0 ⇒ stable; ±10 % change ⇒ increasing/decreasing.
Trend trend_between(double first, double second);

struct MetricsSummary {
  SummaryPeriod period{SummaryPeriod::last_day};
  uint64_t start_unix_ms{0};
  uint64_t end_unix_ms{0};
  uint64_t total_requests{0};
  double   total_cost_usd{0.0};
  double   avg_latency_ms{0.0};
  double   avg_error_rate{0.0};
  std::map<std::string, AggregatedMetric> by_provider_model;   // "provider:model"
  std::map<std::string, AggregatedMetric> by_provider;
  std::map<std::string, AggregatedMetric> by_model;            // model name across providers
  Trend cost_trend{Trend::stable};
  Trend latency_trend{Trend::stable};
  Trend error_trend{Trend::stable};

  std::string to_json() const;
};

struct TaskCost {
  uint64_t requests{0};
  double   cost_usd{0.0};
};

class TelemetryAggregator {
 public:
  TelemetryAggregator(TelemetryConfig tcfg = {}, CircuitConfig ccfg = {},
                      std::shared_ptr<Clock> clock = nullptr);

  void record(TelemetrySample sample);

  std::optional<ModelTelemetry> model(const ModelRef& ref) const;
  std::vector<ModelTelemetry> models() const;

  // Rolling-window stats restricted to samples at or after since_unix_ms.
  WindowStats rolling_since(const ModelRef& ref, uint64_t since_unix_ms) const;

  std::vector<AggregatedMetric> hourly(const ModelRef& ref) const;
  std::vector<AggregatedMetric> daily(const ModelRef& ref) const;

  void set_alpha(const ModelRef& ref, double alpha);
  double alpha(const ModelRef& ref) const;

  MetricsSummary summary(SummaryPeriod period) const;

  // Cost per task category for UTC days at or after since_unix_ms.
  std::map<TaskCategory, TaskCost> cost_by_task_category(uint64_t since_unix_ms) const;

  uint64_t sample_count() const;

  const Clock& clock() const { return *clock_; }

  static constexpr size_t kMaxLogSamples = 20000;   // per model, within 24 h

 private:
  struct Series {
    ModelRef ref;
    double alpha{0.3};
    bool has_ewma{false};
    double ewma_latency{0.0};
    double ewma_error{0.0};
    uint64_t total_requests{0};
    uint64_t total_errors{0};
    double total_cost{0.0};
    uint64_t last_sample_ms{0};
    std::deque<TelemetrySample> log;                 // time-ordered, 24 h
    std::map<uint64_t, AggregatedMetric> hourly;     // hour index -> bucket
    std::map<uint64_t, AggregatedMetric> daily;      // day index -> bucket
  };

  void prune(Series& s, uint64_t now) const;
  // Index into s.log of the first rolling-window sample.
  size_t rolling_begin(const Series& s, uint64_t now) const;
  ModelTelemetry snapshot(const Series& s, uint64_t now) const;

  TelemetryConfig tcfg_;
  CircuitConfig ccfg_;
  std::shared_ptr<Clock> clock_;
  mutable std::mutex mu_;
  std::map<std::string, Series> series_;             // keyed by ModelRef::key()
  std::map<TaskCategory, std::map<uint64_t, TaskCost>> task_costs_;   // day index -> cost
  uint64_t sample_count_{0};
};

}  // namespace routegate
