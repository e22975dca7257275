#include "routegate/policy.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include "routegate/hash.hpp"
#include "routegate/jsonlite.hpp"
#include "routegate/version.hpp"

namespace fs = std::filesystem;

namespace routegate {

namespace {

namespace jl = jsonlite;

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Write to a temp file in the target directory, then rename into place.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

// Organization ids become file names; keep them to a safe alphabet.
bool valid_org_id(const std::string& id) {
  if (id.empty() || id.size() > 128 || id[0] == '.') return false;
  for (char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    if (!ok) return false;
  }
  return true;
}

std::string json_string_array(const std::vector<std::string>& v) {
  std::string out = "[";
  for (size_t i = 0; i < v.size(); ++i) {
    if (i) out += ",";
    out += "\"" + jl::escape(v[i]) + "\"";
  }
  out += "]";
  return out;
}

// A present key of the wrong type is a violation, not a silent default.
void read_u64(const jl::Object& o, const char* key, uint64_t& field, std::vector<std::string>& bad) {
  auto it = o.find(key);
  if (it == o.end()) return;
  if (!std::holds_alternative<std::uint64_t>(it->second.v)) {
    bad.emplace_back(key);
    return;
  }
  field = std::get<std::uint64_t>(it->second.v);
}

void read_u32(const jl::Object& o, const char* key, uint32_t& field, std::vector<std::string>& bad) {
  uint64_t v = field;
  read_u64(o, key, v, bad);
  if (v > 0xFFFFFFFFULL) {
    bad.emplace_back(key);
    return;
  }
  field = static_cast<uint32_t>(v);
}

void read_double(const jl::Object& o, const char* key, double& field, std::vector<std::string>& bad) {
  auto it = o.find(key);
  if (it == o.end()) return;
  if (std::holds_alternative<double>(it->second.v)) {
    field = std::get<double>(it->second.v);
  } else if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    field = static_cast<double>(std::get<std::uint64_t>(it->second.v));
  } else {
    bad.emplace_back(key);
  }
}

PolicyResult failure(ErrorCode code, std::string detail) {
  PolicyResult r;
  r.ok = false;
  r.error = code;
  r.detail = std::move(detail);
  return r;
}

}  // namespace

// ---------------------------------------------------------------------------
// Policy
// ---------------------------------------------------------------------------

bool Policy::allows_provider(const std::string& provider) const {
  return std::find(allowed_providers.begin(), allowed_providers.end(), provider) !=
         allowed_providers.end();
}

const TaskOverride* Policy::override_for(TaskCategory task) const {
  auto it = task_overrides.find(task);
  return it == task_overrides.end() ? nullptr : &it->second;
}

std::vector<std::string> validate_policy(const Policy& p) {
  std::vector<std::string> v;
  if (p.organization_id.empty()) v.emplace_back("organization_id");
  if (!(p.max_daily_cost_usd > 0.0)) v.emplace_back("max_daily_cost_usd");
  if (!(p.max_request_cost_usd > 0.0) || p.max_request_cost_usd > p.max_daily_cost_usd) {
    v.emplace_back("max_request_cost_usd");
  }
  if (p.max_tokens_input == 0) v.emplace_back("max_tokens_input");
  if (p.max_tokens_output == 0) v.emplace_back("max_tokens_output");
  if (p.max_concurrent_jobs == 0) v.emplace_back("max_concurrent_jobs");
  if (p.allowed_providers.empty()) v.emplace_back("allowed_providers");
  for (const auto& prov : p.allowed_providers) {
    if (prov.empty()) {
      v.emplace_back("allowed_providers");
      break;
    }
  }
  if (p.burst_rate_limit == 0) v.emplace_back("burst_rate_limit");
  if (p.sustained_rate_limit == 0) v.emplace_back("sustained_rate_limit");
  for (const auto& [task, ov] : p.task_overrides) {
    const std::string prefix = "task_overrides." + to_string(task);
    if (ov.min_perf < 0.0 || ov.min_perf > 1.0) v.push_back(prefix + ".min_perf");
    if (ov.max_cost_usd && !(*ov.max_cost_usd > 0.0)) v.push_back(prefix + ".max_cost");
  }
  return v;
}

std::string policy_to_json(const Policy& p) {
  std::ostringstream o;
  o << "{\"schema_version\":" << version::POLICY_SCHEMA_VERSION
    << ",\"organization_id\":\"" << jl::escape(p.organization_id) << "\""
    << ",\"trial_mode\":" << (p.trial_mode ? "true" : "false")
    << ",\"max_daily_cost_usd\":" << jl::format_double(p.max_daily_cost_usd)
    << ",\"max_request_cost_usd\":" << jl::format_double(p.max_request_cost_usd)
    << ",\"max_tokens_input\":" << p.max_tokens_input
    << ",\"max_tokens_output\":" << p.max_tokens_output
    << ",\"max_concurrent_jobs\":" << p.max_concurrent_jobs
    << ",\"allowed_providers\":" << json_string_array(p.allowed_providers)
    << ",\"burst_rate_limit\":" << p.burst_rate_limit
    << ",\"sustained_rate_limit\":" << p.sustained_rate_limit
    << ",\"task_overrides\":{";
  bool first = true;
  for (const auto& [task, ov] : p.task_overrides) {
    if (!first) o << ",";
    first = false;
    o << "\"" << to_string(task) << "\":{\"min_perf\":" << jl::format_double(ov.min_perf)
      << ",\"preferred_models\":" << json_string_array(ov.preferred_models);
    if (ov.max_cost_usd) o << ",\"max_cost\":" << jl::format_double(*ov.max_cost_usd);
    o << "}";
  }
  o << "},\"updated_at_unix_ms\":" << p.updated_at_unix_ms << "}";
  return o.str();
}

std::string policy_fingerprint_of(const Policy& p) {
  Policy copy = p;
  copy.updated_at_unix_ms = 0;
  std::optional<jl::JsonError> err;
  const std::string canonical = jl::canonicalize_json(policy_to_json(copy), &err);
  return policy_fingerprint(err ? policy_to_json(copy) : canonical);
}

std::string PolicyResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false");
  if (ok) {
    o << ",\"policy\":" << policy_to_json(policy)
      << ",\"fingerprint\":\"" << policy_fingerprint_of(policy) << "\"";
  } else {
    o << ",\"error_code\":\"" << to_string(error) << "\""
      << ",\"detail\":\"" << jl::escape(detail) << "\""
      << ",\"violations\":" << json_string_array(violations);
  }
  o << "}";
  return o.str();
}

PolicyResult policy_from_json(const std::string& text) {
  std::optional<jl::JsonError> err;
  const jl::Object doc = jl::parse(text, &err);
  if (err) {
    return failure(err->code == "json_duplicate_key" ? ErrorCode::json_duplicate_key
                                                     : ErrorCode::json_parse_error,
                   err->message);
  }

  const auto schema = version::check_policy_schema(
      static_cast<uint32_t>(jl::get_u64(doc, "schema_version", version::POLICY_SCHEMA_VERSION)));
  if (!schema.ok) {
    PolicyResult r = failure(ErrorCode::invalid_policy, schema.description);
    r.violations.emplace_back("schema_version");
    return r;
  }

  Policy p;
  std::vector<std::string> bad;
  p.organization_id = jl::get_string(doc, "organization_id");
  p.trial_mode = jl::get_bool(doc, "trial_mode", false);
  read_double(doc, "max_daily_cost_usd", p.max_daily_cost_usd, bad);
  read_double(doc, "max_request_cost_usd", p.max_request_cost_usd, bad);
  read_u64(doc, "max_tokens_input", p.max_tokens_input, bad);
  read_u64(doc, "max_tokens_output", p.max_tokens_output, bad);
  read_u32(doc, "max_concurrent_jobs", p.max_concurrent_jobs, bad);
  read_u32(doc, "burst_rate_limit", p.burst_rate_limit, bad);
  read_u32(doc, "sustained_rate_limit", p.sustained_rate_limit, bad);
  if (jl::has_key(doc, "allowed_providers")) {
    p.allowed_providers = jl::get_string_array(doc, "allowed_providers");
  }
  p.updated_at_unix_ms = jl::get_u64(doc, "updated_at_unix_ms", 0);

  if (const jl::Object* overrides = jl::get_object(doc, "task_overrides")) {
    for (const auto& [name, val] : *overrides) {
      auto task = parse_task_category(name);
      if (!task) return failure(ErrorCode::unknown_task_category, "unknown task category: " + name);
      if (!std::holds_alternative<jl::Object>(val.v)) {
        bad.push_back("task_overrides." + name);
        continue;
      }
      const auto& o = std::get<jl::Object>(val.v);
      TaskOverride ov;
      ov.min_perf = default_min_perf(*task);
      read_double(o, "min_perf", ov.min_perf, bad);
      ov.preferred_models = jl::get_string_array(o, "preferred_models");
      if (jl::has_key(o, "max_cost")) {
        double mc = 0.0;
        read_double(o, "max_cost", mc, bad);
        ov.max_cost_usd = mc;
      }
      p.task_overrides[*task] = std::move(ov);
    }
  }

  auto violations = validate_policy(p);
  violations.insert(violations.end(), bad.begin(), bad.end());
  if (!violations.empty()) {
    std::sort(violations.begin(), violations.end());
    violations.erase(std::unique(violations.begin(), violations.end()), violations.end());
    PolicyResult r = failure(ErrorCode::invalid_policy, "policy violates invariants");
    r.violations = std::move(violations);
    r.policy = std::move(p);
    return r;
  }
  PolicyResult r;
  r.policy = std::move(p);
  return r;
}

Policy default_policy(const std::string& org_id, const EngineConfig& cfg) {
  Policy p;
  p.organization_id = org_id;
  p.max_daily_cost_usd = cfg.default_max_daily_cost_usd;
  p.max_request_cost_usd = std::min(cfg.default_max_request_cost_usd, cfg.default_max_daily_cost_usd);
  return p;
}

Policy apply_trial_restrictions(Policy p) {
  if (!p.trial_mode) return p;
  p.max_daily_cost_usd = std::min(p.max_daily_cost_usd, 1.00);
  p.max_request_cost_usd = std::min(p.max_request_cost_usd, 0.01);
  p.max_concurrent_jobs = std::min<uint32_t>(p.max_concurrent_jobs, 2);
  p.max_tokens_input = std::min<uint64_t>(p.max_tokens_input, 2000);
  p.max_tokens_output = std::min<uint64_t>(p.max_tokens_output, 1000);
  p.burst_rate_limit = std::min<uint32_t>(p.burst_rate_limit, 5);
  p.sustained_rate_limit = std::min<uint32_t>(p.sustained_rate_limit, 20);
  p.allowed_providers = {"openai"};
  for (auto& [task, ov] : p.task_overrides) {
    if (ov.max_cost_usd) ov.max_cost_usd = std::min(*ov.max_cost_usd, p.max_request_cost_usd);
  }
  return p;
}

TaskConstraints resolve_task_constraints(const Policy& p, TaskCategory task) {
  TaskConstraints c;
  c.min_perf = default_min_perf(task);
  c.max_cost_usd = p.max_request_cost_usd;
  if (const TaskOverride* ov = p.override_for(task)) {
    c.min_perf = ov->min_perf;
    c.preferred_models = ov->preferred_models;
    if (ov->max_cost_usd) c.max_cost_usd = std::min(c.max_cost_usd, *ov->max_cost_usd);
  }
  return c;
}

GuardrailCheck check_token_limits(const Policy& p, uint64_t tokens_in, uint64_t tokens_out) {
  GuardrailCheck g;
  if (tokens_in > p.max_tokens_input) {
    g.allowed = false;
    g.error = ErrorCode::token_limit_exceeded;
    g.reason = "input tokens (" + std::to_string(tokens_in) + ") exceed limit (" +
               std::to_string(p.max_tokens_input) + ")";
  } else if (tokens_out > p.max_tokens_output) {
    g.allowed = false;
    g.error = ErrorCode::token_limit_exceeded;
    g.reason = "output tokens (" + std::to_string(tokens_out) + ") exceed limit (" +
               std::to_string(p.max_tokens_output) + ")";
  }
  return g;
}

// ---------------------------------------------------------------------------
// InMemoryPolicyBackend
// ---------------------------------------------------------------------------

std::optional<std::string> InMemoryPolicyBackend::load(const std::string& org_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = docs_.find(org_id);
  if (it == docs_.end()) return std::nullopt;
  return it->second;
}

bool InMemoryPolicyBackend::store(const std::string& org_id, const std::string& document) {
  std::lock_guard<std::mutex> lk(mu_);
  docs_[org_id] = document;
  return true;
}

bool InMemoryPolicyBackend::remove(const std::string& org_id) {
  std::lock_guard<std::mutex> lk(mu_);
  return docs_.erase(org_id) > 0;
}

std::vector<std::string> InMemoryPolicyBackend::list() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  out.reserve(docs_.size());
  for (const auto& [org, doc] : docs_) out.push_back(org);
  return out;
}

// ---------------------------------------------------------------------------
// FilePolicyBackend
// ---------------------------------------------------------------------------

FilePolicyBackend::FilePolicyBackend(std::string root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "policies", ec);
}

std::string FilePolicyBackend::path_for(const std::string& org_id) const {
  return (fs::path(root_) / "policies" / (org_id + ".json")).string();
}

std::optional<std::string> FilePolicyBackend::load(const std::string& org_id) const {
  if (!valid_org_id(org_id)) return std::nullopt;
  std::lock_guard<std::mutex> lk(mu_);
  std::ifstream ifs(path_for(org_id), std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

bool FilePolicyBackend::store(const std::string& org_id, const std::string& document) {
  if (!valid_org_id(org_id)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  return atomic_write(path_for(org_id), document);
}

bool FilePolicyBackend::remove(const std::string& org_id) {
  if (!valid_org_id(org_id)) return false;
  std::lock_guard<std::mutex> lk(mu_);
  std::error_code ec;
  return fs::remove(path_for(org_id), ec);
}

std::vector<std::string> FilePolicyBackend::list() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  std::error_code ec;
  const fs::path dir = fs::path(root_) / "policies";
  if (!fs::exists(dir, ec)) return out;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file()) continue;
    const auto& p = entry.path();
    if (p.extension() != ".json") continue;
    const std::string stem = p.stem().string();
    if (valid_org_id(stem)) out.push_back(stem);
  }
  std::sort(out.begin(), out.end());
  return out;
}

// ---------------------------------------------------------------------------
// PolicyStore
// ---------------------------------------------------------------------------

PolicyStore::PolicyStore(std::shared_ptr<IPolicyBackend> backend)
    : backend_(backend ? std::move(backend) : std::make_shared<InMemoryPolicyBackend>()) {}

PolicyResult PolicyStore::get_stored(const std::string& org_id) const {
  // Held across the backend read so a concurrent upsert cannot be overwritten
  // in the cache by a stale document.
  std::lock_guard<std::mutex> lk(mu_);
  auto it = cache_.find(org_id);
  if (it != cache_.end()) {
    ++hits_;
    PolicyResult r;
    r.policy = it->second;
    return r;
  }
  ++misses_;

  const auto doc = backend_->load(org_id);
  if (!doc) return failure(ErrorCode::policy_not_found, "no policy configured for " + org_id);

  PolicyResult r = policy_from_json(*doc);
  if (!r.ok) return r;
  r.policy.organization_id = org_id;
  cache_[org_id] = r.policy;
  return r;
}

PolicyResult PolicyStore::get(const std::string& org_id) const {
  PolicyResult r = get_stored(org_id);
  if (r.ok) r.policy = apply_trial_restrictions(std::move(r.policy));
  return r;
}

Policy PolicyStore::get_with_defaults(const std::string& org_id, const EngineConfig& cfg) const {
  PolicyResult r = get(org_id);
  if (r.ok) return r.policy;
  return default_policy(org_id, cfg);
}

PolicyResult PolicyStore::upsert(const std::string& org_id, Policy policy) {
  policy.organization_id = org_id;
  auto violations = validate_policy(policy);
  if (!violations.empty()) {
    PolicyResult r = failure(ErrorCode::invalid_policy, "policy violates invariants");
    r.violations = std::move(violations);
    r.policy = std::move(policy);
    return r;
  }

  const std::string doc = policy_to_json(policy);
  std::lock_guard<std::mutex> lk(mu_);
  if (!backend_->store(org_id, doc)) {
    return failure(ErrorCode::io_error, "policy backend '" + backend_->backend_id() +
                                            "' rejected write for " + org_id);
  }
  cache_.erase(org_id);
  PolicyResult r;
  r.policy = std::move(policy);
  return r;
}

bool PolicyStore::remove(const std::string& org_id) {
  std::lock_guard<std::mutex> lk(mu_);
  cache_.erase(org_id);
  return backend_->remove(org_id);
}

std::vector<std::string> PolicyStore::organizations() const { return backend_->list(); }

uint64_t PolicyStore::cache_hits() const {
  std::lock_guard<std::mutex> lk(mu_);
  return hits_;
}

uint64_t PolicyStore::cache_misses() const {
  std::lock_guard<std::mutex> lk(mu_);
  return misses_;
}

}  // namespace routegate
