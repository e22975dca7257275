#include "routegate/config.hpp"
#include "routegate/jsonlite.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace routegate {

namespace {

namespace jl = jsonlite;

bool parse_env_double(const char* name, double& out, std::string* warnings) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return false;
  char* end = nullptr;
  const double v = std::strtod(e, &end);
  if (end == e || *end != '\0') {
    if (warnings) *warnings += std::string(name) + ": not a number; ";
    return false;
  }
  out = v;
  return true;
}

bool parse_env_u64(const char* name, uint64_t& out, std::string* warnings) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(e, &end, 10);
  if (end == e || *end != '\0') {
    if (warnings) *warnings += std::string(name) + ": not an integer; ";
    return false;
  }
  out = static_cast<uint64_t>(v);
  return true;
}

void overlay_double(const jl::Object& o, const char* key, double& field) {
  field = jl::get_double(o, key, field);
}

void overlay_u64(const jl::Object& o, const char* key, uint64_t& field) {
  field = jl::get_u64(o, key, field);
}

void overlay_u32(const jl::Object& o, const char* key, uint32_t& field) {
  field = static_cast<uint32_t>(jl::get_u64(o, key, field));
}

bool in_unit(double v) { return v >= 0.0 && v <= 1.0; }

std::string fd(double d) { return jl::format_double(d); }

}  // namespace

EngineConfig EngineConfig::defaults() { return EngineConfig{}; }

EngineConfig EngineConfig::from_env(const EngineConfig& base, std::string* warnings) {
  EngineConfig c = base;
  parse_env_double("ROUTEGATE_MAX_DAILY_COST", c.default_max_daily_cost_usd, warnings);
  parse_env_double("ROUTEGATE_MAX_COST_PER_REQUEST", c.default_max_request_cost_usd, warnings);
  parse_env_double("ROUTEGATE_EWMA_ALPHA", c.telemetry.ewma_alpha, warnings);
  parse_env_double("ROUTEGATE_DEVIATION_THRESHOLD", c.circuit.deviation_threshold, warnings);
  parse_env_double("ROUTEGATE_ERROR_CEILING", c.circuit.error_ceiling, warnings);

  if (const char* e = std::getenv("ROUTEGATE_ENABLE_CACHE"); e && e[0]) {
    c.cache.enabled = std::string(e) != "0" && std::string(e) != "false";
  }
  uint64_t hours = 0;
  if (parse_env_u64("ROUTEGATE_CACHE_TTL_HOURS", hours, warnings)) {
    c.cache.ttl_ms = hours * 3600ULL * 1000ULL;
  }
  parse_env_u64("ROUTEGATE_CACHE_MAX_ENTRIES", c.cache.max_entries, warnings);
  uint64_t cooldown_s = 0;
  if (parse_env_u64("ROUTEGATE_CIRCUIT_COOLDOWN_S", cooldown_s, warnings)) {
    c.circuit.cooldown_ms = cooldown_s * 1000ULL;
  }
  return c;
}

std::string EngineConfig::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"weights\":{\"cost\":" << fd(weights.cost)
    << ",\"latency\":" << fd(weights.latency)
    << ",\"error\":" << fd(weights.error)
    << ",\"quality\":" << fd(weights.quality) << "}"
    << ",\"warning_penalty\":" << fd(warning_penalty)
    << ",\"circuit\":{\"deviation_threshold\":" << fd(circuit.deviation_threshold)
    << ",\"error_ceiling\":" << fd(circuit.error_ceiling)
    << ",\"cooldown_ms\":" << circuit.cooldown_ms
    << ",\"rolling_window_ms\":" << circuit.rolling_window_ms
    << ",\"rolling_max_samples\":" << circuit.rolling_max_samples
    << ",\"min_rolling_samples\":" << circuit.min_rolling_samples
    << ",\"min_baseline_samples\":" << circuit.min_baseline_samples << "}"
    << ",\"rate\":{\"burst_window_ms\":" << rate.burst_window_ms
    << ",\"sustained_window_ms\":" << rate.sustained_window_ms << "}"
    << ",\"cache\":{\"enabled\":" << (cache.enabled ? "true" : "false")
    << ",\"ttl_ms\":" << cache.ttl_ms
    << ",\"max_entries\":" << cache.max_entries
    << ",\"max_bytes\":" << cache.max_bytes
    << ",\"eviction_min_hits\":" << cache.eviction_min_hits
    << ",\"serving_cost_usd\":" << fd(cache.serving_cost_usd) << "}"
    << ",\"telemetry\":{\"ewma_alpha\":" << fd(telemetry.ewma_alpha)
    << ",\"hourly_retention_hours\":" << telemetry.hourly_retention_hours
    << ",\"daily_retention_days\":" << telemetry.daily_retention_days << "}"
    << ",\"default_max_daily_cost_usd\":" << fd(default_max_daily_cost_usd)
    << ",\"default_max_request_cost_usd\":" << fd(default_max_request_cost_usd)
    << ",\"decision_retention_per_org\":" << decision_retention_per_org
    << ",\"auto_provision_policies\":" << (auto_provision_policies ? "true" : "false")
    << "}";
  return o.str();
}

std::string ConfigResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false")
    << ",\"error_code\":\"" << to_string(error) << "\""
    << ",\"detail\":\"" << jl::escape(detail) << "\"";
  if (ok) o << ",\"config\":" << config.to_json();
  o << "}";
  return o.str();
}

ConfigResult validate_config(const EngineConfig& cfg) {
  ConfigResult r;
  r.config = cfg;
  std::string problems;
  const auto& w = cfg.weights;
  if (w.cost < 0 || w.latency < 0 || w.error < 0 || w.quality < 0) problems += "weights must be >= 0; ";
  if (w.sum() <= 0.0) problems += "weights must not all be zero; ";
  if (!in_unit(cfg.warning_penalty)) problems += "warning_penalty outside [0,1]; ";
  if (cfg.circuit.deviation_threshold <= 0.0) problems += "circuit.deviation_threshold must be > 0; ";
  if (!in_unit(cfg.circuit.error_ceiling)) problems += "circuit.error_ceiling outside [0,1]; ";
  if (cfg.circuit.rolling_window_ms == 0) problems += "circuit.rolling_window_ms must be > 0; ";
  if (cfg.rate.burst_window_ms == 0 || cfg.rate.sustained_window_ms == 0) problems += "rate windows must be > 0; ";
  if (cfg.telemetry.ewma_alpha <= 0.0 || cfg.telemetry.ewma_alpha > 1.0) problems += "telemetry.ewma_alpha outside (0,1]; ";
  if (cfg.adaptation.min_alpha > cfg.adaptation.max_alpha) problems += "adaptation.min_alpha > max_alpha; ";
  if (cfg.cache.ttl_ms == 0) problems += "cache.ttl_ms must be > 0; ";
  if (cfg.cache.serving_cost_usd < 0.0) problems += "cache.serving_cost_usd must be >= 0; ";
  if (cfg.default_max_request_cost_usd > cfg.default_max_daily_cost_usd) problems += "default_max_request_cost_usd > default_max_daily_cost_usd; ";
  if (cfg.decision_retention_per_org == 0) problems += "decision_retention_per_org must be > 0; ";
  if (!problems.empty()) {
    r.ok = false;
    r.error = ErrorCode::config_invalid;
    r.detail = problems;
  }
  return r;
}

ConfigResult engine_config_from_json(const std::string& text, const EngineConfig& base) {
  std::optional<jl::JsonError> err;
  const jl::Object doc = jl::parse(text, &err);
  if (err) {
    ConfigResult r;
    r.ok = false;
    r.error = err->code == "json_duplicate_key" ? ErrorCode::json_duplicate_key : ErrorCode::json_parse_error;
    r.detail = err->message;
    return r;
  }

  EngineConfig c = base;
  if (const auto* w = jl::get_object(doc, "weights")) {
    overlay_double(*w, "cost", c.weights.cost);
    overlay_double(*w, "latency", c.weights.latency);
    overlay_double(*w, "error", c.weights.error);
    overlay_double(*w, "quality", c.weights.quality);
  }
  overlay_double(doc, "warning_penalty", c.warning_penalty);
  if (const auto* o = jl::get_object(doc, "circuit")) {
    overlay_double(*o, "deviation_threshold", c.circuit.deviation_threshold);
    overlay_double(*o, "error_ceiling", c.circuit.error_ceiling);
    overlay_u64(*o, "cooldown_ms", c.circuit.cooldown_ms);
    overlay_u64(*o, "rolling_window_ms", c.circuit.rolling_window_ms);
    overlay_u32(*o, "rolling_max_samples", c.circuit.rolling_max_samples);
    overlay_u32(*o, "min_rolling_samples", c.circuit.min_rolling_samples);
    overlay_u32(*o, "min_baseline_samples", c.circuit.min_baseline_samples);
    overlay_double(*o, "latency_floor_ms", c.circuit.latency_floor_ms);
    overlay_double(*o, "error_rate_floor", c.circuit.error_rate_floor);
  }
  if (const auto* o = jl::get_object(doc, "rate")) {
    overlay_u64(*o, "burst_window_ms", c.rate.burst_window_ms);
    overlay_u64(*o, "sustained_window_ms", c.rate.sustained_window_ms);
  }
  if (const auto* o = jl::get_object(doc, "cache")) {
    c.cache.enabled = jl::get_bool(*o, "enabled", c.cache.enabled);
    overlay_u64(*o, "ttl_ms", c.cache.ttl_ms);
    overlay_u64(*o, "max_entries", c.cache.max_entries);
    overlay_u64(*o, "max_bytes", c.cache.max_bytes);
    overlay_u64(*o, "eviction_min_hits", c.cache.eviction_min_hits);
    overlay_double(*o, "serving_cost_usd", c.cache.serving_cost_usd);
    overlay_u64(*o, "compress_threshold_bytes", c.cache.compress_threshold_bytes);
  }
  if (const auto* o = jl::get_object(doc, "telemetry")) {
    overlay_double(*o, "ewma_alpha", c.telemetry.ewma_alpha);
    overlay_u32(*o, "hourly_retention_hours", c.telemetry.hourly_retention_hours);
    overlay_u32(*o, "daily_retention_days", c.telemetry.daily_retention_days);
  }
  if (const auto* o = jl::get_object(doc, "adaptation")) {
    overlay_double(*o, "min_alpha", c.adaptation.min_alpha);
    overlay_double(*o, "max_alpha", c.adaptation.max_alpha);
    overlay_double(*o, "target_variance", c.adaptation.target_variance);
    overlay_double(*o, "alpha_step", c.adaptation.alpha_step);
    overlay_double(*o, "disable_error_threshold", c.adaptation.disable_error_threshold);
    overlay_double(*o, "recovery_error_threshold", c.adaptation.recovery_error_threshold);
    overlay_u32(*o, "min_requests_before_disable", c.adaptation.min_requests_before_disable);
    overlay_u32(*o, "min_requests_before_enable", c.adaptation.min_requests_before_enable);
  }
  overlay_double(doc, "default_max_daily_cost_usd", c.default_max_daily_cost_usd);
  overlay_double(doc, "default_max_request_cost_usd", c.default_max_request_cost_usd);
  overlay_u32(doc, "decision_retention_per_org", c.decision_retention_per_org);
  c.auto_provision_policies = jl::get_bool(doc, "auto_provision_policies", c.auto_provision_policies);

  return validate_config(c);
}

ConfigResult load_engine_config(const std::string& path, const EngineConfig& base) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    ConfigResult r;
    r.ok = false;
    r.error = ErrorCode::io_error;
    r.detail = "cannot open config file: " + path;
    return r;
  }
  const std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
  return engine_config_from_json(text, base);
}

}  // namespace routegate
