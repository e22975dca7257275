#include <atomic>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "routegate/adaptation.hpp"
#include "routegate/audit.hpp"
#include "routegate/circuit_breaker.hpp"
#include "routegate/clock.hpp"
#include "routegate/config.hpp"
#include "routegate/decision_engine.hpp"
#include "routegate/decision_log.hpp"
#include "routegate/hash.hpp"
#include "routegate/jsonlite.hpp"
#include "routegate/model_catalog.hpp"
#include "routegate/observability.hpp"
#include "routegate/policy.hpp"
#include "routegate/rate_limiter.hpp"
#include "routegate/response_cache.hpp"
#include "routegate/telemetry.hpp"
#include "routegate/usage_ledger.hpp"
#include "routegate/version.hpp"

namespace fs = std::filesystem;
using namespace routegate;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool near(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

fs::path temp_dir(const std::string& name) {
  fs::path p = fs::temp_directory_path() / ("routegate_test_" + name);
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

std::vector<std::string> read_lines(const fs::path& p) {
  std::vector<std::string> out;
  std::ifstream ifs(p);
  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

const ModelRef kGpt4o{"openai", "gpt-4o"};
const ModelRef kGpt4oMini{"openai", "gpt-4o-mini"};
const ModelRef kGpt35{"openai", "gpt-3.5-turbo"};
const ModelRef kHaiku{"anthropic", "claude-3-haiku"};

// Engine on a manual clock with an in-memory policy backend.
struct Harness {
  std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
  std::unique_ptr<RoutingEngine> engine;

  explicit Harness(EngineConfig cfg = EngineConfig::defaults()) {
    EngineDeps deps;
    deps.clock = clock;
    engine = std::make_unique<RoutingEngine>(cfg, deps);
  }

  Policy policy(const std::string& org) const {
    Policy p;
    p.organization_id = org;
    return p;
  }

  void install(const Policy& p) {
    auto r = engine->upsert_policy(p.organization_id, p);
    expect(r.ok, "policy install: " + r.detail);
  }
};

RouteRequest chat_request(const std::string& org) {
  RouteRequest req;
  req.organization_id = org;
  req.task = TaskCategory::chat;
  req.tokens_in = 1000;
  req.tokens_out = 500;
  return req;
}

const Alternative* find_alternative(const std::vector<Alternative>& alts, const ModelRef& ref) {
  for (const auto& a : alts) {
    if (a.ref == ref) return &a;
  }
  return nullptr;
}

// ============================================================================
// Foundations
// ============================================================================

void test_blake3_known_vectors() {
  expect(blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
}

void test_domain_separation() {
  const std::string material = "same-bytes";
  const auto c = cache_key_hash(material);
  const auto d = decision_id_hash(material);
  const auto r = reservation_id_hash(material);
  const auto p = policy_fingerprint(material);
  expect(c != d && c != r && c != p && d != r && d != p && r != p,
         "domains must produce distinct digests");
  expect(c.size() == 64, "digest is 64 hex chars");
}

void test_json_strict_parse() {
  std::optional<jsonlite::JsonError> err;
  jsonlite::parse("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value() && err->code == "json_duplicate_key", "duplicate key rejected");

  err.reset();
  jsonlite::parse("{\"a\":1} trailing", &err);
  expect(err.has_value() && err->code == "json_parse_error", "trailing data rejected");

  err.reset();
  auto obj = jsonlite::parse("{\"b\":2,\"a\":[1,2],\"c\":\"x\"}", &err);
  expect(!err, "valid object parses");
  expect(jsonlite::get_string(obj, "c") == "x", "string extractor");
  expect(jsonlite::canonicalize_json("{\"b\":2,\"a\":1}", nullptr) == "{\"a\":1,\"b\":2}",
         "canonical form sorts keys");
}

void test_task_categories() {
  expect(parse_task_category("drafting-short") == TaskCategory::drafting_short, "kebab-case wire name");
  expect(to_string(TaskCategory::drafting_long) == "drafting-long", "round trip wire name");
  expect(!parse_task_category("poetry").has_value(), "unknown category");
  expect(all_task_categories().size() == 8, "closed set of eight categories");
  expect(near(default_min_perf(TaskCategory::code), 0.8), "code default min perf");
}

void test_error_taxonomy() {
  expect(is_admission_error(ErrorCode::rate_limited), "rate_limited is admission");
  expect(is_admission_error(ErrorCode::daily_budget_exceeded), "budget is admission");
  expect(is_configuration_error(ErrorCode::policy_not_found), "policy_not_found is configuration");
  expect(is_selection_error(ErrorCode::no_eligible_model), "no_eligible_model is selection");
  expect(!is_selection_error(ErrorCode::rate_limited), "families are disjoint");
  expect(to_string(ErrorCode::request_cost_exceeds_limit) == "request_cost_exceeds_limit",
         "error code wire name");
}

void test_manual_clock() {
  ManualClock clock;
  const uint64_t m0 = clock.monotonic_ms();
  const uint64_t u0 = clock.unix_ms();
  clock.advance_ms(1500);
  expect(clock.monotonic_ms() == m0 + 1500 && clock.unix_ms() == u0 + 1500, "both readings advance");
  expect(unix_ms_to_iso(0) == "1970-01-01T00:00:00.000Z", "ISO formatting");
}

void test_config_validation() {
  EngineConfig cfg = EngineConfig::defaults();
  expect(validate_config(cfg).ok, "defaults are valid");

  EngineConfig bad = cfg;
  bad.weights = ScoringWeights{0, 0, 0, 0};
  auto r = validate_config(bad);
  expect(!r.ok && r.error == ErrorCode::config_invalid, "zero weight sum rejected");

  bad = cfg;
  bad.circuit.error_ceiling = 1.5;
  expect(!validate_config(bad).ok, "threshold outside [0,1] rejected");

  auto parsed = engine_config_from_json("{\"warning_penalty\":0.25}", cfg);
  expect(parsed.ok && near(parsed.config.warning_penalty, 0.25), "config overlay from JSON");

  auto dup = engine_config_from_json("{\"warning_penalty\":0.25,\"warning_penalty\":0.3}", cfg);
  expect(!dup.ok && dup.error == ErrorCode::json_duplicate_key, "duplicate config key rejected");
}

void test_catalog_pricing() {
  const ModelCatalog cat = default_catalog();
  expect(cat.size() == 8, "eight default models");
  expect(near(cat.estimate_cost(kGpt4o, 1000, 500), 0.0125), "gpt-4o 1000/500 tokens");
  expect(near(cat.estimate_cost(ModelRef{"mistral", "unknown"}, 1000000, 1000000), 8.0),
         "unknown models price at 2/6");
  expect(cat.quality_for(TaskCategory::drafting_short, kGpt35) == 0.40, "gpt-3.5 drafting quality");
}

// ============================================================================
// Policy Store
// ============================================================================

void test_policy_roundtrip_and_validation() {
  Policy p;
  p.organization_id = "org-a";
  p.max_daily_cost_usd = 5.0;
  TaskOverride ov;
  ov.min_perf = 0.7;
  ov.preferred_models = {"gpt-4o-mini"};
  p.task_overrides[TaskCategory::summarization] = ov;

  auto decoded = policy_from_json(policy_to_json(p));
  expect(decoded.ok, "policy decodes");
  expect(near(decoded.policy.max_daily_cost_usd, 5.0), "daily cap survives");
  expect(decoded.policy.task_overrides.count(TaskCategory::summarization) == 1, "override survives");
  expect(policy_fingerprint_of(p) == policy_fingerprint_of(decoded.policy), "stable fingerprint");

  Policy bad = p;
  bad.max_request_cost_usd = 6.0;   // above the daily cap
  expect(!validate_policy(bad).empty(), "per-request cap above daily cap is invalid");

  auto unknown = policy_from_json(
      "{\"organization_id\":\"o\",\"task_overrides\":{\"poetry\":{\"min_perf\":0.5}}}");
  expect(!unknown.ok && unknown.error == ErrorCode::unknown_task_category, "unknown override key");
}

void test_policy_store_defaults_and_trial() {
  PolicyStore store;
  auto missing = store.get("nobody");
  expect(!missing.ok && missing.error == ErrorCode::policy_not_found, "missing policy");

  EngineConfig cfg = EngineConfig::defaults();
  Policy d = store.get_with_defaults("nobody", cfg);
  expect(d.organization_id == "nobody", "default carries org id");
  expect(near(d.max_daily_cost_usd, cfg.default_max_daily_cost_usd), "default daily cap");

  Policy trial;
  trial.organization_id = "trial-org";
  trial.trial_mode = true;
  trial.max_daily_cost_usd = 50.0;
  trial.max_request_cost_usd = 1.0;
  expect(store.upsert("trial-org", trial).ok, "trial upsert");

  auto effective = store.get("trial-org");
  expect(effective.ok, "trial read");
  expect(near(effective.policy.max_daily_cost_usd, 1.0), "trial daily cap");
  expect(near(effective.policy.max_request_cost_usd, 0.01), "trial request cap");
  expect(effective.policy.allowed_providers == std::vector<std::string>{"openai"}, "trial providers");

  auto stored = store.get_stored("trial-org");
  expect(near(stored.policy.max_daily_cost_usd, 50.0), "stored document is uncapped");
}

void test_policy_file_backend_persists() {
  const auto dir = temp_dir("policies");
  Policy p;
  p.organization_id = "org-file";
  p.max_daily_cost_usd = 3.0;
  {
    PolicyStore store(std::make_shared<FilePolicyBackend>(dir.string()));
    expect(store.upsert("org-file", p).ok, "file upsert");
  }
  PolicyStore reopened(std::make_shared<FilePolicyBackend>(dir.string()));
  auto r = reopened.get("org-file");
  expect(r.ok && near(r.policy.max_daily_cost_usd, 3.0), "policy survives reopen");
  expect(reopened.organizations() == std::vector<std::string>{"org-file"}, "organization listing");
  expect(reopened.remove("org-file"), "remove");
  expect(!reopened.get("org-file").ok, "removed policy is gone");
}

void test_task_constraints_and_token_limits() {
  Policy p;
  p.organization_id = "o";
  TaskOverride ov;
  ov.min_perf = 0.75;
  ov.max_cost_usd = 0.01;
  ov.preferred_models = {"claude-3-haiku"};
  p.task_overrides[TaskCategory::extraction] = ov;

  auto c = resolve_task_constraints(p, TaskCategory::extraction);
  expect(near(c.min_perf, 0.75) && near(c.max_cost_usd, 0.01), "override applies");
  auto d = resolve_task_constraints(p, TaskCategory::analysis);
  expect(near(d.min_perf, 0.8) && near(d.max_cost_usd, p.max_request_cost_usd), "task default applies");

  expect(check_token_limits(p, 8000, 4000).allowed, "at the limit is allowed");
  auto over = check_token_limits(p, 8001, 10);
  expect(!over.allowed && over.error == ErrorCode::token_limit_exceeded, "input over limit");
}

// ============================================================================
// Usage Ledger / Budget Gate
// ============================================================================

void test_ledger_reserve_commit_release() {
  auto clock = std::make_shared<ManualClock>();
  UsageLedger ledger(clock);
  Policy p;
  p.organization_id = "o";

  auto b = ledger.check_and_reserve(p, 0.02);
  expect(b.ok && !b.reservation.id.empty(), "reserve");
  expect(ledger.usage(p).in_flight == 1 && near(ledger.usage(p).reserved_usd, 0.02), "reserved");

  auto c = ledger.commit(b.reservation.id, 0.015);
  expect(c.ok && near(c.charged_usd, 0.015) && near(c.delta_usd, -0.005), "commit actual");
  auto u = ledger.usage(p);
  expect(u.in_flight == 0 && near(u.committed_usd, 0.015) && near(u.reserved_usd, 0.0), "settled");
  expect(u.request_count == 1, "request counted");

  auto again = ledger.commit(b.reservation.id, 0.015);
  expect(!again.ok && again.error == ErrorCode::reservation_not_found, "double commit rejected");

  auto b2 = ledger.check_and_reserve(p, 0.01);
  expect(ledger.release(b2.reservation.id).ok, "release");
  expect(near(ledger.usage(p).committed_usd, 0.015), "release charges nothing");
}

void test_per_request_cap_reported_first() {
  auto clock = std::make_shared<ManualClock>();
  UsageLedger ledger(clock);
  Policy p;
  p.organization_id = "o";
  p.max_daily_cost_usd = 2.00;
  p.max_request_cost_usd = 0.02;
  p.sustained_rate_limit = 30;
  ledger.record_spend("o", 1.99, 100);

  auto d = ledger.check_and_reserve(p, 0.03);
  expect(!d.ok && d.error == ErrorCode::request_cost_exceeds_limit, "per-request cap checked first");

  auto e = ledger.check_and_reserve(p, 0.015);
  expect(!e.ok && e.error == ErrorCode::daily_budget_exceeded, "remaining $0.01 denies $0.015");
}

void test_concurrency_limit() {
  UsageLedger ledger(std::make_shared<ManualClock>());
  Policy p;
  p.organization_id = "o";
  p.max_concurrent_jobs = 2;
  auto a = ledger.check_and_reserve(p, 0.001);
  auto b = ledger.check_and_reserve(p, 0.001);
  auto c = ledger.check_and_reserve(p, 0.001);
  expect(a.ok && b.ok, "two jobs admitted");
  expect(!c.ok && c.error == ErrorCode::concurrency_limit_exceeded, "third job denied");
  expect(ledger.commit(a.reservation.id, 0.001).ok, "commit frees a slot");
  expect(ledger.check_and_reserve(p, 0.001).ok, "slot reusable");
}

void test_concurrent_budget_no_overshoot() {
  UsageLedger ledger(std::make_shared<ManualClock>());
  Policy p;
  p.organization_id = "o";
  p.max_daily_cost_usd = 1.00;
  p.max_request_cost_usd = 0.03;
  p.max_concurrent_jobs = 1000;

  std::atomic<int> admitted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 50; ++i) {
    threads.emplace_back([&] {
      if (ledger.check_and_reserve(p, 0.03).ok) admitted.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();

  expect(admitted.load() == 33, "exactly floor(1.00/0.03) reservations admitted");
  expect(ledger.usage(p).reserved_usd <= 1.00 + 1e-9, "reserved never exceeds the budget");
}

void test_amend_rechecks_budget() {
  UsageLedger ledger(std::make_shared<ManualClock>());
  Policy p;
  p.organization_id = "o";
  p.max_daily_cost_usd = 0.05;
  p.max_request_cost_usd = 0.05;
  auto a = ledger.check_and_reserve(p, 0.01);
  auto b = ledger.check_and_reserve(p, 0.03);
  expect(a.ok && b.ok, "two reservations");
  auto grow = ledger.amend(a.reservation.id, p, 0.03);
  expect(!grow.ok && grow.error == ErrorCode::daily_budget_exceeded, "growth past budget denied");
  expect(near(ledger.find_reservation(a.reservation.id)->estimated_cost_usd, 0.01),
         "denied amend leaves the reservation untouched");
  expect(ledger.amend(a.reservation.id, p, 0.005).ok, "shrinking always fits");
}

void test_budget_status_thresholds() {
  expect(budget_status(0.79, 1.0) == BudgetStatus::normal, "79% normal");
  expect(budget_status(0.80, 1.0) == BudgetStatus::warning, "80% warning");
  expect(budget_status(0.95, 1.0) == BudgetStatus::critical, "95% critical");
  expect(budget_status(1.00, 1.0) == BudgetStatus::exceeded, "100% exceeded");
}

void test_ledger_day_rollover() {
  auto clock = std::make_shared<ManualClock>();
  UsageLedger ledger(clock);
  Policy p;
  p.organization_id = "o";
  ledger.record_spend("o", 0.5, 10);
  clock->advance_ms(kMsPerDay);
  auto u = ledger.usage(p);
  expect(near(u.committed_usd, 0.0) && u.request_count == 0, "new day starts empty");
  auto hist = ledger.history("o", 7);
  expect(hist.size() == 1 && near(hist[0].cost_usd, 0.5), "closed day kept in history");
}

// ============================================================================
// Rate Limiter
// ============================================================================

void test_rate_burst_sequential() {
  auto clock = std::make_shared<ManualClock>();
  RateLimiter rl(RateConfig{}, clock);
  int denied = 0;
  RateDecision last;
  for (int i = 0; i < 11; ++i) {
    auto d = rl.check_and_increment("o", 10, 60);
    if (!d.allowed) {
      ++denied;
      last = d;
    }
  }
  expect(denied == 1, "burst+1 yields exactly one denial");
  expect(last.error == ErrorCode::rate_limited && last.window == "burst", "burst window denies");
  expect(last.retry_after_ms > 0 && last.retry_after_ms <= 10000, "retry hint within window");

  clock->advance_ms(10000);
  expect(rl.check_and_increment("o", 10, 60).allowed, "new burst window admits");
}

void test_rate_burst_concurrent() {
  RateLimiter rl(RateConfig{}, std::make_shared<ManualClock>());
  std::atomic<int> denied{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 11; ++i) {
    threads.emplace_back([&] {
      if (!rl.check_and_increment("o", 10, 60).allowed) denied.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();
  expect(denied.load() == 1, "concurrent burst+1 yields exactly one denial");
}

void test_rate_sustained_and_refund() {
  auto clock = std::make_shared<ManualClock>();
  RateLimiter rl(RateConfig{}, clock);
  RateDecision admitted;
  for (int i = 0; i < 3; ++i) {
    admitted = rl.check_and_increment("o", 100, 3);
    expect(admitted.allowed, "within sustained");
  }
  auto d = rl.check_and_increment("o", 100, 3);
  expect(!d.allowed && d.window == "sustained", "sustained window denies");
  rl.refund("o", d);
  expect(rl.window("o", RateWindowKind::sustained).count == 3, "denied request has no slot to return");
  rl.refund("o", admitted);
  expect(rl.window("o", RateWindowKind::sustained).count == 2, "refund returns a slot");
  expect(rl.check_and_increment("o", 100, 3).allowed, "refunded slot usable");
  expect(rl.check_and_increment("other", 100, 3).allowed, "organizations are independent");
}

void test_rate_refund_after_rollover() {
  auto clock = std::make_shared<ManualClock>();
  RateLimiter rl(RateConfig{}, clock);
  auto a = rl.check_and_increment("o", 2, 100);
  expect(a.allowed, "first window admits");
  clock->advance_ms(11000);
  expect(rl.check_and_increment("o", 2, 100).allowed, "second window admits b");
  expect(rl.check_and_increment("o", 2, 100).allowed, "second window admits c");

  rl.refund("o", a);
  expect(rl.window("o", RateWindowKind::burst).count == 2, "stale refund leaves the new burst window full");
  expect(rl.window("o", RateWindowKind::sustained).count == 2, "sustained window still holds a");
  auto d = rl.check_and_increment("o", 2, 100);
  expect(!d.allowed && d.window == "burst", "burst limit holds after stale refund");
}

// ============================================================================
// Telemetry Aggregator
// ============================================================================

void test_telemetry_ewma() {
  auto clock = std::make_shared<ManualClock>();
  TelemetryAggregator t(TelemetryConfig{}, CircuitConfig{}, clock);
  t.record(TelemetrySample{"o", kGpt4o, 0, 1000.0, true, 0.01, TaskCategory::chat});
  t.record(TelemetrySample{"o", kGpt4o, 0, 2000.0, false, 0.01, TaskCategory::chat});
  auto m = t.model(kGpt4o);
  expect(m.has_value(), "model tracked");
  expect(near(m->ewma_latency_ms, 1300.0), "latency EWMA with alpha 0.3");
  expect(near(m->ewma_error_rate, 0.3), "error EWMA with alpha 0.3");
  expect(m->total_requests == 2 && m->total_errors == 1, "totals");

  t.set_alpha(kGpt4o, 0.5);
  expect(near(t.alpha(kGpt4o), 0.5), "alpha adjustable");
  expect(!t.model(kHaiku).has_value(), "untracked model has no telemetry");
}

void test_telemetry_summary_and_task_costs() {
  auto clock = std::make_shared<ManualClock>();
  TelemetryAggregator t(TelemetryConfig{}, CircuitConfig{}, clock);
  for (int i = 0; i < 4; ++i) {
    t.record(TelemetrySample{"o", kGpt4o, 0, 1000.0, i != 0, 0.01, TaskCategory::code});
    t.record(TelemetrySample{"o", kHaiku, 0, 500.0, true, 0.001, TaskCategory::chat});
    clock->advance_ms(60000);
  }
  auto s = t.summary(SummaryPeriod::last_hour);
  expect(s.total_requests == 8, "hour summary counts all samples");
  expect(s.by_provider.count("openai") == 1 && s.by_provider.count("anthropic") == 1, "by provider");
  expect(near(s.by_provider_model["openai:gpt-4o"].error_rate(), 0.25), "per-model error rate");

  auto costs = t.cost_by_task_category(0);
  expect(costs[TaskCategory::code].requests == 4 && near(costs[TaskCategory::code].cost_usd, 0.04),
         "cost by task category");

  expect(trend_between(100.0, 115.0) == Trend::increasing, "+15% is increasing");
  expect(trend_between(100.0, 105.0) == Trend::stable, "+5% is stable");
  expect(trend_between(0.0, 50.0) == Trend::stable, "zero first half is stable");
}

// ============================================================================
// Circuit Breaker
// ============================================================================

void test_circuit_trips_and_recovers() {
  auto clock = std::make_shared<ManualClock>();
  CircuitConfig cc;
  auto telemetry = std::make_shared<TelemetryAggregator>(TelemetryConfig{}, cc, clock);
  CircuitBreaker breaker(cc, telemetry, clock);

  // Baseline: 100 samples at 5% errors.
  for (int i = 0; i < 100; ++i) {
    telemetry->record(TelemetrySample{"o", kGpt4o, 0, 1000.0, i % 20 != 0, 0.0, std::nullopt});
    clock->advance_ms(1000);
  }
  expect(breaker.status(kGpt4o) == CircuitStatus::healthy, "healthy baseline");

  // Move past the rolling window, then a 50% error burst.
  clock->advance_ms(cc.rolling_window_ms + 1000);
  for (int i = 0; i < 10; ++i) {
    telemetry->record(TelemetrySample{"o", kGpt4o, 0, 1000.0, i % 2 == 0, 0.0, std::nullopt});
  }
  auto st = breaker.evaluate(kGpt4o);
  expect(st.status == CircuitStatus::critical, "50% errors open the circuit");
  expect(circuit_position(st.status) == "open", "critical is open");
  expect(st.trips == 1, "one trip");

  // Good samples during the cool-down do not close it.
  clock->advance_ms(1000);
  for (int i = 0; i < 5; ++i) {
    telemetry->record(TelemetrySample{"o", kGpt4o, 0, 1000.0, true, 0.0, std::nullopt});
  }
  expect(breaker.status(kGpt4o) == CircuitStatus::critical, "no recovery inside cool-down");

  clock->advance_ms(cc.cooldown_ms);
  for (int i = 0; i < 5; ++i) {
    telemetry->record(TelemetrySample{"o", kGpt4o, 0, 1000.0, true, 0.0, std::nullopt});
  }
  expect(breaker.status(kGpt4o) != CircuitStatus::critical, "fresh healthy window closes it");

  const auto events = breaker.recent_events();
  expect(events.size() >= 2, "transitions recorded");
  expect(events.front().to == CircuitStatus::critical, "first transition opens");
}

void test_circuit_excludes_model_from_routing() {
  Harness h;
  Policy p = h.policy("o");
  h.install(p);
  for (int i = 0; i < 100; ++i) {
    h.engine->telemetry().record(TelemetrySample{"o", kGpt4oMini, 0, 900.0, i % 20 != 0, 0.0, std::nullopt});
    h.clock->advance_ms(1000);
  }
  h.clock->advance_ms(6 * 60 * 1000);
  for (int i = 0; i < 10; ++i) {
    h.engine->telemetry().record(TelemetrySample{"o", kGpt4oMini, 0, 900.0, i % 2 == 0, 0.0, std::nullopt});
  }

  auto d = h.engine->route_request(chat_request("o"));
  expect(d.ok, "routing succeeds around the open circuit");
  expect(!(d.selected == kGpt4oMini), "open-circuit model never selected");
  const Alternative* alt = find_alternative(d.alternatives, kGpt4oMini);
  expect(alt && alt->rejected && alt->reject_reason == RejectReason::circuit_open,
         "open circuit reported as CircuitOpen");
}

void test_health_assessment_classification() {
  CircuitConfig cc;
  WindowStats baseline{100, 5, 1000.0, 0.05, 0.0};
  WindowStats slow{10, 0, 1500.0, 0.05, 0.0};
  auto a = assess_health(kGpt4o, slow, baseline, cc);
  expect(a.status == CircuitStatus::warning, "one deviation is warning");
  WindowStats bad{10, 2, 1500.0, 0.2, 0.0};
  expect(assess_health(kGpt4o, bad, baseline, cc).status == CircuitStatus::critical,
         "two deviations are critical");
  WindowStats thin{3, 3, 5000.0, 1.0, 0.0};
  expect(assess_health(kGpt4o, thin, baseline, cc).status == CircuitStatus::healthy,
         "too few samples make no judgement");
}

// ============================================================================
// Response Cache
// ============================================================================

void test_cache_key_normalization() {
  CacheKeyMaterial a{"  Hello\n\n  world ", "", kGpt4o, 0.7, 2000};
  CacheKeyMaterial b{"Hello world", "", kGpt4o, 0.7, 2000};
  expect(compute_cache_key(a) == compute_cache_key(b), "whitespace-normalized prompts share a key");
  expect(compute_cache_key(a) == compute_cache_key(a), "key is idempotent");
  CacheKeyMaterial c = b;
  c.ref = kHaiku;
  expect(compute_cache_key(b) != compute_cache_key(c), "model is part of the key");
  CacheKeyMaterial e = b;
  e.temperature = 0.2;
  expect(compute_cache_key(b) != compute_cache_key(e), "temperature is part of the key");
}

void test_cache_hit_count_and_payload() {
  auto clock = std::make_shared<ManualClock>();
  ResponseCache cache(CacheConfig{}, clock);
  const std::string key = compute_cache_key(CacheKeyMaterial{"q", "", kGpt4o, 0.7, 2000});
  expect(!cache.lookup(key).has_value(), "miss before store");
  expect(cache.store(key, kGpt4o, "answer", 0.01), "store");
  expect(!cache.store(key, kGpt4o, "other", 0.01), "live entry is not replaced");

  auto first = cache.lookup(key);
  auto second = cache.lookup(key);
  expect(first && second && first->completion == "answer" && second->completion == "answer",
         "identical payload on every hit");
  expect(second->hit_count == 2, "hit count increments");
  expect(cache.peek(key)->hit_count == 2, "peek does not count");

  auto stats = cache.stats();
  expect(stats.hits == 2 && stats.misses == 1, "hit/miss accounting");
  expect(near(stats.estimated_savings_usd, 0.02), "savings = cost * hits");
}

void test_cache_expiry_and_invalidation() {
  auto clock = std::make_shared<ManualClock>();
  ResponseCache cache(CacheConfig{}, clock);
  const std::string k1 = compute_cache_key(CacheKeyMaterial{"a", "", kGpt4o, 0.7, 2000});
  const std::string k2 = compute_cache_key(CacheKeyMaterial{"b", "", kGpt4o, 0.7, 2000});
  const std::string k3 = compute_cache_key(CacheKeyMaterial{"c", "", kHaiku, 0.7, 2000});
  cache.store(k1, kGpt4o, "1", 0.0, 1000);
  cache.store(k2, kGpt4o, "2", 0.0);
  cache.store(k3, kHaiku, "3", 0.0);

  clock->advance_ms(1001);
  expect(!cache.lookup(k1).has_value(), "expired entry is a miss");
  expect(cache.cleanup_expired() <= 1, "cleanup tolerates already-removed entries");

  expect(cache.invalidate_model(kGpt4o) == 1, "invalidate by model");
  expect(!cache.peek(k2).has_value() && cache.peek(k3).has_value(), "only that model removed");
  expect(cache.invalidate(k3) && cache.size() == 0, "invalidate by key");
}

void test_cache_capacity_eviction() {
  auto clock = std::make_shared<ManualClock>();
  CacheConfig cfg;
  cfg.max_entries = 2;
  ResponseCache cache(cfg, clock);
  for (int i = 0; i < 3; ++i) {
    const std::string k = compute_cache_key(CacheKeyMaterial{"p" + std::to_string(i), "", kGpt4o, 0.7, 2000});
    cache.store(k, kGpt4o, "x", 0.0);
    clock->advance_ms(10);
  }
  expect(cache.size() == 2, "capacity bound holds");
  expect(cache.stats().evictions == 1, "one eviction");
}

// ============================================================================
// Decision Engine
// ============================================================================

void test_select_model_scoring() {
  const ModelCatalog cat = default_catalog();
  std::vector<CandidateInput> in;
  for (const ModelSpec* s : cat.models_for(TaskCategory::chat)) {
    CandidateInput c;
    c.spec = s;
    c.estimated_cost_usd = cat.estimate_cost(s->ref, 1000, 500);
    c.latency_ms = s->default_latency_ms;
    in.push_back(c);
  }
  SelectionConstraints sc;
  sc.min_perf = 0.5;
  sc.max_cost_usd = 0.03;
  sc.allowed_providers = {"openai", "anthropic"};

  auto r = select_model(TaskCategory::chat, in, sc, ScoringWeights{}, 0.5);
  expect(r.ok, "selection succeeds");
  expect(r.alternatives.size() == in.size(), "every candidate reported");
  const Alternative& chosen = r.alternatives[r.selected];
  expect(!chosen.rejected, "winner is eligible");
  for (const auto& a : r.alternatives) {
    if (a.rejected) continue;
    expect(a.factors.total_score <= chosen.factors.total_score + 1e-12, "winner has the top score");
    expect(a.factors.cost_score >= 0.0 && a.factors.cost_score <= 1.0, "cost score in [0,1]");
  }
  auto again = select_model(TaskCategory::chat, in, sc, ScoringWeights{}, 0.5);
  expect(again.selected == r.selected && again.alternatives[again.selected].factors == chosen.factors,
         "pure selection is deterministic");

  sc.force_cheapest = true;
  auto cheap = select_model(TaskCategory::chat, in, sc, ScoringWeights{}, 0.5);
  expect(cheap.alternatives[cheap.selected].ref == kGpt4oMini, "force cheapest takes the lowest cost");
}

void test_tie_break_ignores_preferred_models() {
  ModelSpec first;
  first.ref = ModelRef{"anthropic", "twin-a"};
  first.quality[TaskCategory::chat] = 0.8;
  ModelSpec second = first;
  second.ref = ModelRef{"openai", "twin-b"};

  std::vector<CandidateInput> in;
  for (const ModelSpec* s : {&second, &first}) {
    CandidateInput c;
    c.spec = s;
    c.estimated_cost_usd = 0.002;
    c.latency_ms = 900;
    in.push_back(c);
  }
  SelectionConstraints sc;
  sc.max_cost_usd = 0.03;
  sc.allowed_providers = {"openai", "anthropic"};
  sc.preferred_models = {"twin-b"};

  auto scored = select_model(TaskCategory::chat, in, sc, ScoringWeights{}, 0.5);
  expect(scored.ok && scored.alternatives[scored.selected].ref == first.ref,
         "equal score and cost fall back to provider:model order");
  sc.force_cheapest = true;
  auto cheap = select_model(TaskCategory::chat, in, sc, ScoringWeights{}, 0.5);
  expect(cheap.ok && cheap.alternatives[cheap.selected].ref == first.ref,
         "force cheapest breaks cost ties the same way");
}

void test_half_open_penalty() {
  const ModelCatalog cat = default_catalog();
  std::vector<CandidateInput> in;
  for (const ModelRef& ref : {kGpt4oMini, kHaiku}) {
    CandidateInput c;
    c.spec = cat.find(ref);
    c.estimated_cost_usd = 0.001;
    c.latency_ms = 800;
    in.push_back(c);
  }
  in[0].circuit = CircuitStatus::warning;
  SelectionConstraints sc;
  sc.max_cost_usd = 1.0;
  sc.allowed_providers = {"openai", "anthropic"};
  auto r = select_model(TaskCategory::chat, in, sc, ScoringWeights{}, 0.5);
  expect(r.ok && r.alternatives[0].half_open, "half-open flagged");
  expect(r.alternatives[r.selected].ref == kHaiku, "penalized model loses");
}

void test_drafting_short_min_perf_override() {
  Harness h;
  Policy p = h.policy("o");
  TaskOverride ov;
  ov.min_perf = 0.5;
  ov.preferred_models = {"gpt-4o-mini", "claude-3-haiku"};
  p.task_overrides[TaskCategory::drafting_short] = ov;
  h.install(p);

  RouteRequest req = chat_request("o");
  req.task = TaskCategory::drafting_short;
  req.tokens_in = 500;
  req.tokens_out = 500;
  for (int i = 0; i < 5; ++i) {
    auto d = h.engine->route_request(req);
    expect(d.ok, "drafting request routed");
    expect(!(d.selected == kGpt35), "below-min model never selected");
    const Alternative* alt = find_alternative(d.alternatives, kGpt35);
    expect(alt && alt->rejected && alt->reject_reason == RejectReason::below_min_performance,
           "gpt-3.5 reported as BelowMinPerformance");
    expect(to_string(alt->reject_reason) == "BelowMinPerformance", "reason wire name");
    expect(h.engine->cancel(d.reservation_id).ok, "cancel");
  }
}

void test_engine_request_cost_exceeds_limit() {
  Harness h;
  Policy p = h.policy("o");
  p.max_daily_cost_usd = 2.00;
  p.max_request_cost_usd = 0.02;
  p.sustained_rate_limit = 30;
  h.install(p);
  h.engine->ledger().record_spend("o", 1.99, 100);

  RouteRequest req = chat_request("o");
  req.estimated_cost_usd = 0.03;
  auto d = h.engine->route_request(req);
  expect(!d.ok && d.error == ErrorCode::request_cost_exceeds_limit, "per-request cap denies first");
  expect(h.engine->ledger().open_reservations() == 0, "nothing left reserved");
  expect(h.engine->rate_limiter().window("o", RateWindowKind::burst).count == 0,
         "budget denial never reaches the rate limiter");
}

void test_engine_cancel_after_burst_rollover() {
  Harness h;
  Policy p = h.policy("o");
  p.burst_rate_limit = 2;
  h.install(p);

  auto a = h.engine->route_request(chat_request("o"));
  expect(a.ok, "a routed");
  h.clock->advance_ms(11000);
  expect(h.engine->route_request(chat_request("o")).ok, "b routed");
  expect(h.engine->route_request(chat_request("o")).ok, "c routed");

  expect(h.engine->cancel(a.reservation_id).ok, "cancel a");
  auto d = h.engine->route_request(chat_request("o"));
  expect(!d.ok && d.error == ErrorCode::rate_limited, "burst window stays full after late cancel");
  expect(h.engine->ledger().open_reservations() == 2, "b and c still reserved");
}

void test_engine_rate_limit_releases_reservation() {
  Harness h;
  Policy p = h.policy("o");
  p.burst_rate_limit = 2;
  h.install(p);
  expect(h.engine->route_request(chat_request("o")).ok, "first");
  expect(h.engine->route_request(chat_request("o")).ok, "second");
  auto d = h.engine->route_request(chat_request("o"));
  expect(!d.ok && d.error == ErrorCode::rate_limited, "third is rate limited");
  expect(d.retry_after_ms > 0, "retry hint");
  expect(h.engine->ledger().open_reservations() == 2, "denied request released its reservation");
}

void test_engine_concurrent_burst() {
  Harness h;
  Policy p = h.policy("o");
  p.burst_rate_limit = 10;
  p.max_concurrent_jobs = 100;
  h.install(p);

  std::atomic<int> rate_limited{0};
  std::atomic<int> admitted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 11; ++i) {
    threads.emplace_back([&] {
      auto d = h.engine->route_request(chat_request("o"));
      if (d.ok) admitted.fetch_add(1);
      if (d.error == ErrorCode::rate_limited) rate_limited.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();
  expect(admitted.load() == 10 && rate_limited.load() == 1, "exactly one of burst+1 rate limited");
}

void test_engine_policy_not_found_and_auto_provision() {
  Harness strict;
  auto d = strict.engine->route_request(chat_request("ghost"));
  expect(!d.ok && d.error == ErrorCode::policy_not_found, "no policy, no routing");

  EngineConfig cfg = EngineConfig::defaults();
  cfg.auto_provision_policies = true;
  Harness lenient(cfg);
  auto e = lenient.engine->route_request(chat_request("ghost"));
  expect(e.ok, "auto-provisioned default policy routes");
}

void test_engine_token_limit() {
  Harness h;
  h.install(h.policy("o"));
  RouteRequest req = chat_request("o");
  req.tokens_out = 5000;
  auto d = h.engine->route_request(req);
  expect(!d.ok && d.error == ErrorCode::token_limit_exceeded, "output tokens over limit");
}

void test_engine_force_cheapest_under_budget_pressure() {
  Harness h;
  Policy p = h.policy("o");
  p.max_daily_cost_usd = 1.00;
  h.install(p);
  h.engine->ledger().record_spend("o", 0.96, 10);

  auto d = h.engine->route_request(chat_request("o"));
  expect(d.ok, "routed under pressure");
  expect(d.force_cheapest, "critical budget forces cheapest");
  expect(d.selected == kGpt4oMini, "cheapest eligible model");
  expect(d.budget_status == BudgetStatus::critical, "status reported");
  expect(d.reason.find("Forced cheapest") == 0, "reason names the override");
}

void test_engine_no_eligible_model() {
  Harness h;
  Policy p = h.policy("o");
  p.allowed_providers = {"mistral"};
  h.install(p);
  RouteRequest req = chat_request("o");
  req.estimated_cost_usd = 0.001;
  auto d = h.engine->route_request(req);
  expect(!d.ok && d.error == ErrorCode::no_eligible_model, "no allowed provider in catalog");
  expect(d.alternatives.size() == 8, "every candidate reported");
  for (const auto& a : d.alternatives) {
    expect(a.rejected && a.reject_reason == RejectReason::provider_not_allowed, "ProviderNotAllowed");
  }
  expect(h.engine->ledger().open_reservations() == 0, "reservation released");
  expect(h.engine->rate_limiter().window("o", RateWindowKind::burst).count == 0, "rate slot refunded");
}

void test_engine_outcome_reconciles_ledger_and_telemetry() {
  Harness h;
  h.install(h.policy("o"));
  auto d = h.engine->route_request(chat_request("o"));
  expect(d.ok && h.engine->pending_routes() == 1, "routed");

  OutcomeReport rep;
  rep.reservation_id = d.reservation_id;
  rep.actual_cost_usd = 0.0004;
  rep.latency_ms = 850.0;
  auto r = h.engine->report_outcome(rep);
  expect(r.ok && r.ref == d.selected, "outcome attributed to the selected model");
  expect(near(r.charged_usd, 0.0004), "actual cost charged");
  expect(near(h.engine->usage("o").committed_usd, 0.0004), "ledger committed");
  auto t = h.engine->telemetry().model(d.selected);
  expect(t && t->total_requests == 1 && near(t->ewma_latency_ms, 850.0), "telemetry fed");

  auto again = h.engine->report_outcome(rep);
  expect(!again.ok && again.error == ErrorCode::reservation_not_found, "second report rejected");

  // Timeout with unknown cost: charge the estimate, record an error.
  auto d2 = h.engine->route_request(chat_request("o"));
  OutcomeReport timeout;
  timeout.reservation_id = d2.reservation_id;
  timeout.timed_out = true;
  timeout.latency_ms = 30000.0;
  auto r2 = h.engine->report_outcome(timeout);
  expect(r2.ok && near(r2.charged_usd, d2.estimated_cost_usd), "estimate charged on timeout");
  expect(h.engine->telemetry().model(d2.selected)->total_errors == 1, "timeout is an error sample");
}

void test_engine_cache_hit_flow() {
  EngineConfig cfg = EngineConfig::defaults();
  cfg.cache.serving_cost_usd = 0.0001;
  Harness h(cfg);
  h.install(h.policy("o"));

  RouteRequest req = chat_request("o");
  req.prompt = "What is the capital of France?";
  auto miss = h.engine->route_request(req);
  expect(miss.ok && !miss.cache_hit && !miss.cache_key.empty(), "first request misses");

  OutcomeReport rep;
  rep.reservation_id = miss.reservation_id;
  rep.latency_ms = 700.0;
  rep.completion = "Paris";
  auto r = h.engine->report_outcome(rep);
  expect(r.ok && r.cached, "completion cached on success");

  RouteRequest again = req;
  again.prompt = "  What is the capital   of France?  ";
  auto hit = h.engine->route_request(again);
  expect(hit.ok && hit.cache_hit, "normalized prompt hits");
  expect(hit.cached_completion == "Paris", "cached payload returned");
  expect(hit.reservation_id.empty(), "hit is settled immediately");
  expect(near(hit.estimated_cost_usd, 0.0001), "serving cost charged");
  expect(h.engine->ledger().open_reservations() == 0, "no reservation outstanding");
  expect(h.engine->cache().peek(hit.cache_key)->hit_count == 1, "hit counted");

  auto explained = h.engine->decisions().explain(hit.decision_id);
  expect(explained && explained->decision.cache_hit, "cache hit recorded in the decision log");
}

void test_engine_determinism() {
  auto run = [] {
    Harness h;
    Policy p = h.policy("o");
    p.max_concurrent_jobs = 100;
    h.install(p);
    std::vector<std::string> out;
    for (TaskCategory task : all_task_categories()) {
      RouteRequest req = chat_request("o");
      req.task = task;
      req.tokens_in = 400;
      req.tokens_out = 300;
      auto d = h.engine->route_request(req);
      out.push_back(d.ok ? d.selected.key() + "|" + d.decision_id + "|" + d.factors.to_json()
                         : to_string(d.error));
      h.clock->advance_ms(20000);
    }
    return out;
  };
  expect(run() == run(), "identical inputs yield identical decisions");
}

// ============================================================================
// Decision Log
// ============================================================================

void test_decision_log_explain() {
  Harness h;
  h.install(h.policy("o"));
  auto d = h.engine->route_request(chat_request("o"));
  expect(d.ok && d.decision_id.rfind("dec-", 0) == 0, "decision id assigned");

  auto ex = h.engine->decisions().explain(d.decision_id);
  expect(ex.has_value(), "explainable");
  expect(ex->decision.selected == d.selected, "explains the recorded selection");
  expect(ex->insights.alternatives_considered + ex->insights.alternatives_filtered == d.alternatives.size(),
         "alternatives counted");
  expect(!ex->insights.primary_factor.empty(), "primary factor identified");
  expect(ex->summary.find(d.selected.key()) != std::string::npos, "summary names the model");
  expect(!h.engine->decisions().explain("dec-missing").has_value(), "unknown id");
}

void test_decision_log_retention_and_stats() {
  DecisionLog log(3);
  for (int i = 0; i < 5; ++i) {
    Decision d;
    d.organization_id = "o";
    d.unix_ms = 1000 + i;
    d.selected = i % 2 ? kHaiku : kGpt4oMini;
    d.estimated_cost_usd = 0.01;
    d.constraints.force_cheapest = i == 4;
    log.record(d);
  }
  auto hist = log.history("o");
  expect(hist.size() == 3, "retention bound");
  expect(hist.front().unix_ms == 1004, "newest first");

  DecisionFilter f;
  f.provider = "anthropic";
  expect(log.history("o", f).size() == 1, "provider filter");

  auto stats = log.stats("o");
  expect(stats.total == 3 && near(stats.avg_cost_usd, 0.01), "stats over retained decisions");
  expect(stats.force_cheapest_count == 1, "force cheapest counted");

  auto perf = log.provider_performance("o");
  expect(!perf.empty() && perf.front().ref == kGpt4oMini && perf.front().times_selected == 2,
         "most selected first");
}

void test_cost_efficiency_insight() {
  Decision d;
  d.selected = kGpt4o;
  d.estimated_cost_usd = 0.01;
  d.factors.total_score = 0.80;
  Alternative cheap;
  cheap.ref = kGpt4oMini;
  cheap.estimated_cost_usd = 0.001;
  cheap.factors.total_score = 0.75;
  d.alternatives.push_back(cheap);
  expect(analyze_decision(d).cost_efficiency == "poor", "near-equal alternative at a fraction of the cost");
  d.alternatives[0].estimated_cost_usd = 0.008;
  expect(analyze_decision(d).cost_efficiency == "good", "comparable alternative");
  d.constraints.force_cheapest = true;
  expect(analyze_decision(d).cost_efficiency == "optimal", "forced cheapest is optimal");
  expect(analyze_decision(d).budget_constrained, "forced cheapest is budget constrained");
}

// ============================================================================
// Adaptation
// ============================================================================

void test_adaptation_alpha_tuning() {
  Harness h;
  h.install(h.policy("o"));
  AdaptationEngine adapt(h.engine->config().adaptation, *h.engine);
  for (int i = 0; i < 20; ++i) {
    h.engine->telemetry().record(TelemetrySample{"o", kGpt4oMini, 0, 900.0, i % 2 == 0, 0.0, std::nullopt});
  }
  adapt.tick("o");
  expect(h.engine->telemetry().alpha(kGpt4oMini) > 0.3 + 1e-9, "volatile errors raise alpha");
  expect(adapt.event_count() >= 1, "alpha change recorded");
}

void test_adaptation_disable_guardrail_recover() {
  Harness h;
  h.install(h.policy("o"));
  AdaptationEngine adapt(h.engine->config().adaptation, *h.engine);

  for (int i = 0; i < 20; ++i) {
    h.engine->telemetry().record(TelemetrySample{"o", kGpt4o, 0, 1800.0, false, 0.0, std::nullopt});
  }
  adapt.tick("o");
  auto pol = h.engine->policies().get_stored("o");
  expect(pol.ok && pol.policy.allowed_providers == std::vector<std::string>{"anthropic"},
         "failing provider removed");
  expect(adapt.disabled_providers("o").count("openai") == 1, "removal remembered");

  for (int i = 0; i < 20; ++i) {
    h.engine->telemetry().record(TelemetrySample{"o", kHaiku, 0, 800.0, false, 0.0, std::nullopt});
  }
  auto events = adapt.tick("o");
  bool blocked = false;
  for (const auto& ev : events) {
    if (ev.kind == AdaptationKind::disable_provider && ev.subject == "anthropic") {
      blocked = !ev.applied && ev.block_reason == "last allowed provider";
    }
  }
  expect(blocked, "last provider is never removed");
  expect(h.engine->policies().get_stored("o").policy.allowed_providers.size() == 1, "one provider left");

  // Recovery is judged on the rolling window only.
  h.clock->advance_ms(h.engine->config().circuit.rolling_window_ms + 1000);
  for (int i = 0; i < 10; ++i) {
    h.engine->telemetry().record(TelemetrySample{"o", kGpt4o, 0, 1800.0, true, 0.0, std::nullopt});
  }
  adapt.tick("o");
  auto restored = h.engine->policies().get_stored("o");
  expect(restored.policy.allows_provider("openai"), "recovered provider restored");
  expect(adapt.disabled_providers("o").empty(), "nothing left disabled");
}

// ============================================================================
// Audit and observability
// ============================================================================

void test_audit_chain() {
  const auto dir = temp_dir("audit");
  const auto path = dir / "audit.ndjson";
  set_audit_log_path(path.string());

  AuditRecord a;
  a.kind = "denial";
  a.organization_id = "o";
  a.error_code = "rate_limited";
  a.engine_semver = "test";
  AuditRecord b = a;
  expect(global_audit_log().append(a) && global_audit_log().append(b), "appends succeed");
  expect(b.sequence == a.sequence + 1, "sequence increases");

  auto lines = read_lines(path);
  expect(lines.size() == 2, "two lines written");
  expect(b.previous_digest == deterministic_digest(lines[0]), "second entry chains the first");
  expect(lines[1].find("\"prev\":\"" + deterministic_digest(lines[0]) + "\"") != std::string::npos,
         "chain visible in the journal");

  set_audit_log_path("");
}

void test_router_stats_and_hook() {
  static std::atomic<int> hook_calls{0};
  global_router_stats().reset();
  set_router_event_hook([](const RouterEvent&) { hook_calls.fetch_add(1); });

  Harness h;
  Policy p = h.policy("o");
  p.burst_rate_limit = 1;
  h.install(p);
  h.engine->route_request(chat_request("o"));
  h.engine->route_request(chat_request("o"));

  auto& stats = global_router_stats();
  expect(stats.route_requests.load() == 2, "two route events");
  expect(stats.admitted.load() == 1 && stats.denied.load() == 1, "admitted vs denied");
  expect(stats.denial_breakdown().total() == 1, "denial breakdown");
  expect(hook_calls.load() == 2, "hook receives every event");
  expect(stats.recent_events_snapshot().size() == 2, "ring keeps recent events");
  set_router_event_hook(nullptr);
}

void test_version_manifest() {
  auto m = version::current_manifest("1.2.3");
  expect(m.engine_semver == "1.2.3" && m.hash_primitive == "blake3", "manifest fields");
  expect(version::check_policy_schema(version::POLICY_SCHEMA_VERSION).ok, "current schema accepted");
  expect(!version::check_policy_schema(version::POLICY_SCHEMA_VERSION + 1).ok, "newer schema rejected");
}

}  // namespace

int main() {
  std::cout << "=== RouteGate Test Suite ===\n";

  std::cout << "\n[Foundations] Hashing, JSON, clock, config\n";
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("domain separation", test_domain_separation);
  run_test("strict JSON parse", test_json_strict_parse);
  run_test("task categories", test_task_categories);
  run_test("error taxonomy", test_error_taxonomy);
  run_test("manual clock", test_manual_clock);
  run_test("config validation", test_config_validation);
  run_test("catalog pricing", test_catalog_pricing);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[Policy Store]\n";
  run_test("policy round trip + validation", test_policy_roundtrip_and_validation);
  run_test("defaults and trial caps", test_policy_store_defaults_and_trial);
  run_test("file backend persists", test_policy_file_backend_persists);
  run_test("task constraints + token limits", test_task_constraints_and_token_limits);

  std::cout << "\n[Usage Ledger] Budget gate\n";
  run_test("reserve/commit/release", test_ledger_reserve_commit_release);
  run_test("per-request cap reported first", test_per_request_cap_reported_first);
  run_test("concurrency limit", test_concurrency_limit);
  run_test("concurrent budget no overshoot (50 threads)", test_concurrent_budget_no_overshoot);
  run_test("amend re-checks budget", test_amend_rechecks_budget);
  run_test("budget status thresholds", test_budget_status_thresholds);
  run_test("day rollover", test_ledger_day_rollover);

  std::cout << "\n[Rate Limiter]\n";
  run_test("burst+1 sequential", test_rate_burst_sequential);
  run_test("burst+1 concurrent", test_rate_burst_concurrent);
  run_test("sustained window + refund", test_rate_sustained_and_refund);
  run_test("refund after window rollover", test_rate_refund_after_rollover);

  std::cout << "\n[Telemetry]\n";
  run_test("EWMA", test_telemetry_ewma);
  run_test("summary + task costs", test_telemetry_summary_and_task_costs);

  std::cout << "\n[Circuit Breaker]\n";
  run_test("trip and recover", test_circuit_trips_and_recovers);
  run_test("open circuit excluded from routing", test_circuit_excludes_model_from_routing);
  run_test("health classification", test_health_assessment_classification);

  std::cout << "\n[Response Cache]\n";
  run_test("key normalization", test_cache_key_normalization);
  run_test("hit count + identical payload", test_cache_hit_count_and_payload);
  run_test("expiry + invalidation", test_cache_expiry_and_invalidation);
  run_test("capacity eviction", test_cache_capacity_eviction);

  std::cout << "\n[Decision Engine]\n";
  run_test("select_model scoring", test_select_model_scoring);
  run_test("tie-break order", test_tie_break_ignores_preferred_models);
  run_test("half-open penalty", test_half_open_penalty);
  run_test("drafting-short min perf override", test_drafting_short_min_perf_override);
  run_test("request cost exceeds limit", test_engine_request_cost_exceeds_limit);
  run_test("rate denial releases reservation", test_engine_rate_limit_releases_reservation);
  run_test("cancel after burst rollover", test_engine_cancel_after_burst_rollover);
  run_test("concurrent burst+1", test_engine_concurrent_burst);
  run_test("policy not found / auto-provision", test_engine_policy_not_found_and_auto_provision);
  run_test("token limit", test_engine_token_limit);
  run_test("force cheapest under budget pressure", test_engine_force_cheapest_under_budget_pressure);
  run_test("no eligible model", test_engine_no_eligible_model);
  run_test("outcome reconciliation", test_engine_outcome_reconciles_ledger_and_telemetry);
  run_test("cache hit flow", test_engine_cache_hit_flow);
  run_test("determinism", test_engine_determinism);

  std::cout << "\n[Decision Log]\n";
  run_test("explain", test_decision_log_explain);
  run_test("retention + stats", test_decision_log_retention_and_stats);
  run_test("cost efficiency insight", test_cost_efficiency_insight);

  std::cout << "\n[Adaptation]\n";
  run_test("alpha tuning", test_adaptation_alpha_tuning);
  run_test("disable / guardrail / recover", test_adaptation_disable_guardrail_recover);

  std::cout << "\n[Audit & Observability]\n";
  run_test("audit hash chain", test_audit_chain);
  run_test("router stats + hook", test_router_stats_and_hook);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
