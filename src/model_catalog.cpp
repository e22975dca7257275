#include "routegate/model_catalog.hpp"

#include <algorithm>
#include <sstream>
#include <variant>

namespace routegate {

namespace {

// Quality columns in all_task_categories() order:
// drafting-short, drafting-long, summarization, classification,
// extraction, analysis, code, chat
struct Row {
  const char* provider;
  const char* model;
  double in;
  double out;
  double latency_ms;
  double q[8];
};

constexpr Row kDefaultRows[] = {
    {"openai", "gpt-4o",             5.00, 15.00, 1800, {0.95, 0.93, 0.92, 0.92, 0.93, 0.93, 0.94, 0.94}},
    {"openai", "gpt-4o-mini",        0.15,  0.60,  900, {0.80, 0.72, 0.78, 0.82, 0.78, 0.70, 0.72, 0.80}},
    {"openai", "gpt-4-turbo",       10.00, 30.00, 2500, {0.92, 0.90, 0.90, 0.90, 0.90, 0.91, 0.92, 0.90}},
    {"openai", "gpt-3.5-turbo",      0.50,  1.50,  700, {0.40, 0.45, 0.60, 0.70, 0.60, 0.45, 0.55, 0.65}},
    {"anthropic", "claude-3-opus",  15.00, 75.00, 4000, {0.96, 0.96, 0.94, 0.92, 0.93, 0.96, 0.93, 0.94}},
    {"anthropic", "claude-3-sonnet", 3.00, 15.00, 2200, {0.85, 0.84, 0.85, 0.85, 0.84, 0.84, 0.82, 0.85}},
    {"anthropic", "claude-3-haiku",  0.25,  1.25,  800, {0.70, 0.60, 0.75, 0.80, 0.75, 0.55, 0.60, 0.75}},
    {"anthropic", "claude-3-5-sonnet", 3.00, 15.00, 1900, {0.94, 0.94, 0.93, 0.92, 0.92, 0.94, 0.95, 0.93}},
};

}  // namespace

std::string ModelSpec::to_json() const {
  std::ostringstream o;
  o << "{\"provider\":\"" << jsonlite::escape(ref.provider) << "\""
    << ",\"model\":\"" << jsonlite::escape(ref.model) << "\""
    << ",\"input_usd_per_mtok\":" << jsonlite::format_double(pricing.input_usd_per_mtok)
    << ",\"output_usd_per_mtok\":" << jsonlite::format_double(pricing.output_usd_per_mtok)
    << ",\"default_latency_ms\":" << jsonlite::format_double(default_latency_ms)
    << ",\"quality\":{";
  bool first = true;
  for (const auto& [task, q] : quality) {
    if (!first) o << ",";
    first = false;
    o << "\"" << to_string(task) << "\":" << jsonlite::format_double(q);
  }
  o << "}}";
  return o.str();
}

void ModelCatalog::register_model(ModelSpec spec) {
  const std::string key = spec.ref.key();
  models_[key] = std::move(spec);
}

const ModelSpec* ModelCatalog::find(const ModelRef& ref) const {
  auto it = models_.find(ref.key());
  return it == models_.end() ? nullptr : &it->second;
}

std::vector<const ModelSpec*> ModelCatalog::models_for(TaskCategory task) const {
  std::vector<const ModelSpec*> out;
  // models_ is keyed by "provider:model", which matches ModelRef ordering
  // except when a provider name is a prefix of another; sort to be exact.
  for (const auto& [key, spec] : models_) {
    if (spec.quality.count(task)) out.push_back(&spec);
  }
  std::sort(out.begin(), out.end(),
            [](const ModelSpec* a, const ModelSpec* b) { return a->ref < b->ref; });
  return out;
}

std::vector<const ModelSpec*> ModelCatalog::all() const {
  std::vector<const ModelSpec*> out;
  out.reserve(models_.size());
  for (const auto& [key, spec] : models_) out.push_back(&spec);
  return out;
}

std::optional<double> ModelCatalog::quality_for(TaskCategory task, const ModelRef& ref) const {
  const ModelSpec* spec = find(ref);
  if (!spec) return std::nullopt;
  auto it = spec->quality.find(task);
  if (it == spec->quality.end()) return std::nullopt;
  return it->second;
}

ModelPricing ModelCatalog::pricing_for(const ModelRef& ref) const {
  const ModelSpec* spec = find(ref);
  return spec ? spec->pricing : ModelPricing{};
}

double ModelCatalog::estimate_cost(const ModelRef& ref, uint64_t tokens_in, uint64_t tokens_out) const {
  const ModelPricing p = pricing_for(ref);
  return (static_cast<double>(tokens_in) / 1e6) * p.input_usd_per_mtok +
         (static_cast<double>(tokens_out) / 1e6) * p.output_usd_per_mtok;
}

std::string ModelCatalog::to_json() const {
  std::string out = "{\"models\":[";
  bool first = true;
  for (const auto& [key, spec] : models_) {
    if (!first) out += ",";
    first = false;
    out += spec.to_json();
  }
  out += "]}";
  return out;
}

ModelCatalog default_catalog() {
  ModelCatalog c;
  const auto& tasks = all_task_categories();
  for (const Row& r : kDefaultRows) {
    ModelSpec s;
    s.ref = ModelRef{r.provider, r.model};
    s.pricing = ModelPricing{r.in, r.out};
    s.default_latency_ms = r.latency_ms;
    for (size_t i = 0; i < tasks.size() && i < 8; ++i) s.quality[tasks[i]] = r.q[i];
    c.register_model(std::move(s));
  }
  return c;
}

CatalogLoadResult catalog_from_json(const jsonlite::Object& doc) {
  CatalogLoadResult r;
  const jsonlite::Array* models = jsonlite::get_array(doc, "models");
  if (!models) {
    r.ok = false;
    r.error = ErrorCode::config_invalid;
    r.detail = "catalog: missing \"models\" array";
    return r;
  }
  for (const auto& item : *models) {
    if (!std::holds_alternative<jsonlite::Object>(item.v)) {
      r.ok = false;
      r.error = ErrorCode::config_invalid;
      r.detail = "catalog: model entry is not an object";
      return r;
    }
    const auto& m = std::get<jsonlite::Object>(item.v);
    ModelSpec s;
    s.ref.provider = jsonlite::get_string(m, "provider");
    s.ref.model = jsonlite::get_string(m, "model");
    if (s.ref.provider.empty() || s.ref.model.empty()) {
      r.ok = false;
      r.error = ErrorCode::config_invalid;
      r.detail = "catalog: provider and model are required";
      return r;
    }
    s.pricing.input_usd_per_mtok = jsonlite::get_double(m, "input_usd_per_mtok", 2.00);
    s.pricing.output_usd_per_mtok = jsonlite::get_double(m, "output_usd_per_mtok", 6.00);
    s.default_latency_ms = jsonlite::get_double(m, "default_latency_ms", 1000.0);
    if (const jsonlite::Object* q = jsonlite::get_object(m, "quality")) {
      for (const auto& [name, val] : *q) {
        auto task = parse_task_category(name);
        if (!task) {
          r.ok = false;
          r.error = ErrorCode::unknown_task_category;
          r.detail = "catalog: unknown task category '" + name + "' for " + s.ref.key();
          return r;
        }
        double qv = 0.0;
        if (std::holds_alternative<double>(val.v)) qv = std::get<double>(val.v);
        else if (std::holds_alternative<std::uint64_t>(val.v)) qv = static_cast<double>(std::get<std::uint64_t>(val.v));
        if (qv < 0.0 || qv > 1.0) {
          r.ok = false;
          r.error = ErrorCode::config_invalid;
          r.detail = "catalog: quality outside [0,1] for " + s.ref.key();
          return r;
        }
        s.quality[*task] = qv;
      }
    }
    r.catalog.register_model(std::move(s));
  }
  return r;
}

}  // namespace routegate
