#include "routegate/telemetry.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

#include "routegate/jsonlite.hpp"

namespace routegate {

namespace {

namespace jl = jsonlite;

std::string fd(double d) { return jl::format_double(d); }

WindowStats stats_of(const std::deque<TelemetrySample>& log, size_t begin, size_t end,
                     uint64_t since_ms) {
  WindowStats w;
  double latency_sum = 0.0;
  for (size_t i = begin; i < end; ++i) {
    const auto& s = log[i];
    if (s.unix_ms < since_ms) continue;
    ++w.samples;
    if (!s.success) ++w.errors;
    latency_sum += s.latency_ms;
    w.cost_usd += s.cost_usd;
  }
  if (w.samples > 0) {
    w.avg_latency_ms = latency_sum / static_cast<double>(w.samples);
    w.error_rate = static_cast<double>(w.errors) / static_cast<double>(w.samples);
  }
  return w;
}

AggregatedMetric metric_of(const TelemetrySample& s) {
  AggregatedMetric m;
  m.ref = s.ref;
  m.total_requests = 1;
  m.errors = s.success ? 0 : 1;
  m.latency_sum_ms = s.latency_ms;
  m.cost_sum_usd = s.cost_usd;
  return m;
}

// Adds `m` into the bucket at `key`, or into the newest bucket when `key` is
// older than it.
void add_to_bucket(std::map<uint64_t, AggregatedMetric>& buckets, uint64_t key, uint64_t width_ms,
                   const AggregatedMetric& m) {
  if (!buckets.empty() && key < buckets.rbegin()->first) key = buckets.rbegin()->first;
  auto& b = buckets[key];
  if (b.period_ms == 0) {
    b.ref = m.ref;
    b.period_start_ms = key * width_ms;
    b.period_ms = width_ms;
  }
  b.add(m);
}

struct HalfSplit {
  AggregatedMetric total;
  std::map<std::string, AggregatedMetric> first;
  std::map<std::string, AggregatedMetric> second;
};

double sum_cost(const std::map<std::string, AggregatedMetric>& m) {
  double c = 0.0;
  for (const auto& [k, v] : m) c += v.cost_sum_usd;
  return c;
}

// Unweighted mean over models, matching how dashboards average per-model rows.
double mean_latency(const std::map<std::string, AggregatedMetric>& m) {
  if (m.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& [k, v] : m) sum += v.avg_latency_ms();
  return sum / static_cast<double>(m.size());
}

double mean_error(const std::map<std::string, AggregatedMetric>& m) {
  if (m.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& [k, v] : m) sum += v.error_rate();
  return sum / static_cast<double>(m.size());
}

}  // namespace

// ---------------------------------------------------------------------------
// AggregatedMetric
// ---------------------------------------------------------------------------

void AggregatedMetric::add(const AggregatedMetric& o) {
  total_requests += o.total_requests;
  errors += o.errors;
  latency_sum_ms += o.latency_sum_ms;
  cost_sum_usd += o.cost_sum_usd;
}

double AggregatedMetric::avg_latency_ms() const {
  return total_requests ? latency_sum_ms / static_cast<double>(total_requests) : 0.0;
}

double AggregatedMetric::error_rate() const {
  return total_requests ? static_cast<double>(errors) / static_cast<double>(total_requests) : 0.0;
}

double AggregatedMetric::success_rate() const { return total_requests ? 1.0 - error_rate() : 0.0; }

double AggregatedMetric::avg_cost_per_request() const {
  return total_requests ? cost_sum_usd / static_cast<double>(total_requests) : 0.0;
}

std::string AggregatedMetric::to_json() const {
  std::ostringstream o;
  o << "{\"provider\":\"" << jl::escape(ref.provider) << "\""
    << ",\"model\":\"" << jl::escape(ref.model) << "\""
    << ",\"period_start\":\"" << unix_ms_to_iso(period_start_ms) << "\""
    << ",\"total_requests\":" << total_requests
    << ",\"avg_latency_ms\":" << fd(avg_latency_ms())
    << ",\"error_rate\":" << fd(error_rate())
    << ",\"success_rate\":" << fd(success_rate())
    << ",\"avg_cost_per_request\":" << fd(avg_cost_per_request())
    << ",\"total_cost_usd\":" << fd(cost_sum_usd) << "}";
  return o.str();
}

std::string ModelTelemetry::to_json() const {
  std::ostringstream o;
  o << "{\"provider\":\"" << jl::escape(ref.provider) << "\""
    << ",\"model\":\"" << jl::escape(ref.model) << "\""
    << ",\"alpha\":" << fd(alpha)
    << ",\"ewma_latency_ms\":" << fd(ewma_latency_ms)
    << ",\"ewma_error_rate\":" << fd(ewma_error_rate)
    << ",\"total_requests\":" << total_requests
    << ",\"total_errors\":" << total_errors
    << ",\"total_cost_usd\":" << fd(total_cost_usd)
    << ",\"rolling\":{\"samples\":" << rolling.samples
    << ",\"avg_latency_ms\":" << fd(rolling.avg_latency_ms)
    << ",\"error_rate\":" << fd(rolling.error_rate) << "}"
    << ",\"baseline\":{\"samples\":" << baseline.samples
    << ",\"avg_latency_ms\":" << fd(baseline.avg_latency_ms)
    << ",\"error_rate\":" << fd(baseline.error_rate) << "}}";
  return o.str();
}

// ---------------------------------------------------------------------------
// Periods and trends
// ---------------------------------------------------------------------------

std::string to_string(SummaryPeriod p) {
  switch (p) {
    case SummaryPeriod::last_hour: return "1h";
    case SummaryPeriod::last_day: return "24h";
    case SummaryPeriod::last_week: return "7d";
    case SummaryPeriod::last_month: return "30d";
  }
  return "24h";
}

std::string to_string(Trend t) {
  switch (t) {
    case Trend::increasing: return "increasing";
    case Trend::stable: return "stable";
    case Trend::decreasing: return "decreasing";
  }
  return "stable";
}

std::optional<SummaryPeriod> parse_summary_period(const std::string& s) {
  if (s == "1h") return SummaryPeriod::last_hour;
  if (s == "24h") return SummaryPeriod::last_day;
  if (s == "7d") return SummaryPeriod::last_week;
  if (s == "30d") return SummaryPeriod::last_month;
  return std::nullopt;
}

uint64_t period_ms(SummaryPeriod p) {
  switch (p) {
    case SummaryPeriod::last_hour: return kMsPerHour;
    case SummaryPeriod::last_day: return kMsPerDay;
    case SummaryPeriod::last_week: return 7 * kMsPerDay;
    case SummaryPeriod::last_month: return 30 * kMsPerDay;
  }
  return kMsPerDay;
}

Trend trend_between(double first, double second) {
  if (first == 0.0 || second == 0.0) return Trend::stable;
  const double change = (second - first) / first;
  if (change > 0.1) return Trend::increasing;
  if (change < -0.1) return Trend::decreasing;
  return Trend::stable;
}

std::string MetricsSummary::to_json() const {
  auto map_json = [](const std::map<std::string, AggregatedMetric>& m) {
    std::string out = "{";
    bool first = true;
    for (const auto& [k, v] : m) {
      if (!first) out += ",";
      first = false;
      out += "\"" + jl::escape(k) + "\":" + v.to_json();
    }
    return out + "}";
  };
  std::ostringstream o;
  o << "{\"period\":\"" << to_string(period) << "\""
    << ",\"start\":\"" << unix_ms_to_iso(start_unix_ms) << "\""
    << ",\"end\":\"" << unix_ms_to_iso(end_unix_ms) << "\""
    << ",\"total_requests\":" << total_requests
    << ",\"total_cost_usd\":" << fd(total_cost_usd)
    << ",\"avg_latency_ms\":" << fd(avg_latency_ms)
    << ",\"avg_error_rate\":" << fd(avg_error_rate)
    << ",\"by_provider_model\":" << map_json(by_provider_model)
    << ",\"by_provider\":" << map_json(by_provider)
    << ",\"by_model\":" << map_json(by_model)
    << ",\"trends\":{\"cost\":\"" << to_string(cost_trend) << "\""
    << ",\"latency\":\"" << to_string(latency_trend) << "\""
    << ",\"error\":\"" << to_string(error_trend) << "\"}}";
  return o.str();
}

// ---------------------------------------------------------------------------
// TelemetryAggregator
// ---------------------------------------------------------------------------

TelemetryAggregator::TelemetryAggregator(TelemetryConfig tcfg, CircuitConfig ccfg,
                                         std::shared_ptr<Clock> clock)
    : tcfg_(tcfg), ccfg_(ccfg), clock_(clock ? std::move(clock) : system_clock()) {}

void TelemetryAggregator::prune(Series& s, uint64_t now) const {
  const uint64_t log_cutoff = now > kMsPerDay ? now - kMsPerDay : 0;
  while (!s.log.empty() && (s.log.front().unix_ms < log_cutoff || s.log.size() > kMaxLogSamples)) {
    s.log.pop_front();
  }
  const uint64_t hour_now = now / kMsPerHour;
  while (!s.hourly.empty() && s.hourly.begin()->first + tcfg_.hourly_retention_hours <= hour_now) {
    s.hourly.erase(s.hourly.begin());
  }
  const uint64_t day_now = day_index(now);
  while (!s.daily.empty() && s.daily.begin()->first + tcfg_.daily_retention_days <= day_now) {
    s.daily.erase(s.daily.begin());
  }
}

size_t TelemetryAggregator::rolling_begin(const Series& s, uint64_t now) const {
  const uint64_t cutoff = now > ccfg_.rolling_window_ms ? now - ccfg_.rolling_window_ms : 0;
  size_t begin = s.log.size();
  size_t taken = 0;
  while (begin > 0 && taken < ccfg_.rolling_max_samples && s.log[begin - 1].unix_ms >= cutoff) {
    --begin;
    ++taken;
  }
  return begin;
}

ModelTelemetry TelemetryAggregator::snapshot(const Series& s, uint64_t now) const {
  ModelTelemetry t;
  t.ref = s.ref;
  t.alpha = s.alpha;
  t.ewma_latency_ms = s.ewma_latency;
  t.ewma_error_rate = s.ewma_error;
  t.total_requests = s.total_requests;
  t.total_errors = s.total_errors;
  t.total_cost_usd = s.total_cost;
  t.last_sample_unix_ms = s.last_sample_ms;
  const size_t begin = rolling_begin(s, now);
  const uint64_t day_ago = now > kMsPerDay ? now - kMsPerDay : 0;
  t.rolling = stats_of(s.log, begin, s.log.size(), 0);
  t.baseline = stats_of(s.log, 0, begin, day_ago);
  return t;
}

void TelemetryAggregator::record(TelemetrySample sample) {
  const uint64_t now = clock_->unix_ms();
  if (sample.unix_ms == 0) sample.unix_ms = now;

  std::lock_guard<std::mutex> lk(mu_);
  auto [it, inserted] = series_.try_emplace(sample.ref.key());
  Series& s = it->second;
  if (inserted) {
    s.ref = sample.ref;
    s.alpha = tcfg_.ewma_alpha;
  }

  const double err = sample.success ? 0.0 : 1.0;
  if (!s.has_ewma) {
    s.ewma_latency = sample.latency_ms;
    s.ewma_error = err;
    s.has_ewma = true;
  } else {
    s.ewma_latency = s.alpha * sample.latency_ms + (1.0 - s.alpha) * s.ewma_latency;
    s.ewma_error = s.alpha * err + (1.0 - s.alpha) * s.ewma_error;
  }
  ++s.total_requests;
  if (!sample.success) ++s.total_errors;
  s.total_cost += sample.cost_usd;
  s.last_sample_ms = std::max(s.last_sample_ms, sample.unix_ms);

  // Keep the log time-ordered even if a caller reports out of order.
  auto pos = s.log.end();
  while (pos != s.log.begin() && std::prev(pos)->unix_ms > sample.unix_ms) --pos;
  s.log.insert(pos, sample);

  const AggregatedMetric m = metric_of(sample);
  add_to_bucket(s.hourly, sample.unix_ms / kMsPerHour, kMsPerHour, m);
  add_to_bucket(s.daily, day_index(sample.unix_ms), kMsPerDay, m);

  if (sample.task) {
    auto& days = task_costs_[*sample.task];
    auto& tc = days[day_index(sample.unix_ms)];
    ++tc.requests;
    tc.cost_usd += sample.cost_usd;
    while (!days.empty() && days.begin()->first + tcfg_.daily_retention_days <= day_index(now)) {
      days.erase(days.begin());
    }
  }

  ++sample_count_;
  prune(s, now);
}

std::optional<ModelTelemetry> TelemetryAggregator::model(const ModelRef& ref) const {
  const uint64_t now = clock_->unix_ms();
  std::lock_guard<std::mutex> lk(mu_);
  auto it = series_.find(ref.key());
  if (it == series_.end()) return std::nullopt;
  return snapshot(it->second, now);
}

std::vector<ModelTelemetry> TelemetryAggregator::models() const {
  const uint64_t now = clock_->unix_ms();
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<ModelTelemetry> out;
  out.reserve(series_.size());
  for (const auto& [key, s] : series_) out.push_back(snapshot(s, now));
  return out;
}

WindowStats TelemetryAggregator::rolling_since(const ModelRef& ref, uint64_t since_unix_ms) const {
  const uint64_t now = clock_->unix_ms();
  std::lock_guard<std::mutex> lk(mu_);
  auto it = series_.find(ref.key());
  if (it == series_.end()) return {};
  const Series& s = it->second;
  return stats_of(s.log, rolling_begin(s, now), s.log.size(), since_unix_ms);
}

std::vector<AggregatedMetric> TelemetryAggregator::hourly(const ModelRef& ref) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<AggregatedMetric> out;
  auto it = series_.find(ref.key());
  if (it == series_.end()) return out;
  for (const auto& [h, b] : it->second.hourly) out.push_back(b);
  return out;
}

std::vector<AggregatedMetric> TelemetryAggregator::daily(const ModelRef& ref) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<AggregatedMetric> out;
  auto it = series_.find(ref.key());
  if (it == series_.end()) return out;
  for (const auto& [d, b] : it->second.daily) out.push_back(b);
  return out;
}

void TelemetryAggregator::set_alpha(const ModelRef& ref, double alpha) {
  std::lock_guard<std::mutex> lk(mu_);
  auto [it, inserted] = series_.try_emplace(ref.key());
  if (inserted) it->second.ref = ref;
  it->second.alpha = std::clamp(alpha, 0.01, 1.0);
}

double TelemetryAggregator::alpha(const ModelRef& ref) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = series_.find(ref.key());
  return it == series_.end() ? tcfg_.ewma_alpha : it->second.alpha;
}

MetricsSummary TelemetryAggregator::summary(SummaryPeriod period) const {
  MetricsSummary out;
  out.period = period;
  out.end_unix_ms = clock_->unix_ms();
  const uint64_t span = period_ms(period);
  out.start_unix_ms = out.end_unix_ms > span ? out.end_unix_ms - span : 0;
  const uint64_t mid = out.start_unix_ms + (out.end_unix_ms - out.start_unix_ms) / 2;
  // Within 24 h the raw log has full resolution; longer periods use day buckets.
  const bool from_log = span <= kMsPerDay;

  HalfSplit split;
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& [key, s] : series_) {
    AggregatedMetric whole;
    whole.ref = s.ref;
    AggregatedMetric first = whole;
    AggregatedMetric second = whole;
    if (from_log) {
      for (const auto& sample : s.log) {
        if (sample.unix_ms < out.start_unix_ms || sample.unix_ms > out.end_unix_ms) continue;
        const AggregatedMetric m = metric_of(sample);
        whole.add(m);
        (sample.unix_ms < mid ? first : second).add(m);
      }
    } else {
      for (const auto& [day, b] : s.daily) {
        if (b.period_start_ms + b.period_ms <= out.start_unix_ms) continue;
        whole.add(b);
        (b.period_start_ms < mid ? first : second).add(b);
      }
    }
    if (whole.total_requests == 0) continue;

    out.by_provider_model[key] = whole;
    auto& bp = out.by_provider[s.ref.provider];
    bp.ref.provider = s.ref.provider;
    bp.add(whole);
    auto& bm = out.by_model[s.ref.model];
    bm.ref.model = s.ref.model;
    if (bm.ref.provider.empty()) bm.ref.provider = s.ref.provider;
    bm.add(whole);
    split.total.add(whole);
    if (first.total_requests) split.first[key] = first;
    if (second.total_requests) split.second[key] = second;
  }

  out.total_requests = split.total.total_requests;
  out.total_cost_usd = split.total.cost_sum_usd;
  out.avg_latency_ms = split.total.avg_latency_ms();
  out.avg_error_rate = split.total.error_rate();
  out.cost_trend = trend_between(sum_cost(split.first), sum_cost(split.second));
  out.latency_trend = trend_between(mean_latency(split.first), mean_latency(split.second));
  out.error_trend = trend_between(mean_error(split.first), mean_error(split.second));
  return out;
}

std::map<TaskCategory, TaskCost> TelemetryAggregator::cost_by_task_category(uint64_t since_unix_ms) const {
  const uint64_t since_day = day_index(since_unix_ms);
  std::lock_guard<std::mutex> lk(mu_);
  std::map<TaskCategory, TaskCost> out;
  for (const auto& [task, days] : task_costs_) {
    for (auto it = days.lower_bound(since_day); it != days.end(); ++it) {
      auto& tc = out[task];
      tc.requests += it->second.requests;
      tc.cost_usd += it->second.cost_usd;
    }
  }
  return out;
}

uint64_t TelemetryAggregator::sample_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sample_count_;
}

}  // namespace routegate
