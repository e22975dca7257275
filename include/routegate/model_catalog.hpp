#pragma once

// routegate/model_catalog.hpp — Registered provider/model pairs, pricing and
// static capability ratings.
//
// DESIGN:
//   The catalog is the only source of "which models exist for a task".
//   A model is registered for a task category iff it carries a quality rating
//   for that category. Quality is static configuration, independent of live
//   telemetry; live behaviour comes from the TelemetryAggregator.
//
// CONCURRENCY:
//   Immutable after construction. The engine shares it as
//   std::shared_ptr<const ModelCatalog>; no locking needed.
//
// PRICING:
//   USD per 1M tokens. Models without a pricing entry (or unknown pairs passed
//   to estimate_cost()) price at the fallback rate of 2.00 in / 6.00 out.

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "routegate/jsonlite.hpp"
#include "routegate/types.hpp"

namespace routegate {

struct ModelPricing {
  double input_usd_per_mtok{2.00};
  double output_usd_per_mtok{6.00};
};

struct ModelSpec {
  ModelRef     ref;
  ModelPricing pricing;
  double       default_latency_ms{1000.0};     // prior used before telemetry exists
  std::map<TaskCategory, double> quality;      // [0,1] per task category

  std::string to_json() const;
};

class ModelCatalog {
 public:
  ModelCatalog() = default;

  // Adds or replaces a model (keyed by provider:model).
  void register_model(ModelSpec spec);

  const ModelSpec* find(const ModelRef& ref) const;

  // Models registered for the task, ordered by provider/model.
  std::vector<const ModelSpec*> models_for(TaskCategory task) const;

  std::vector<const ModelSpec*> all() const;

  std::optional<double> quality_for(TaskCategory task, const ModelRef& ref) const;

  ModelPricing pricing_for(const ModelRef& ref) const;

  // in/1e6 * input + out/1e6 * output
  double estimate_cost(const ModelRef& ref, uint64_t tokens_in, uint64_t tokens_out) const;

  size_t size() const { return models_.size(); }

  std::string to_json() const;

 private:
  std::map<std::string, ModelSpec> models_;   // keyed by ModelRef::key()
};

// Built-in catalog: OpenAI and Anthropic models with list prices.
ModelCatalog default_catalog();

// {"models":[{"provider":..,"model":..,"input_usd_per_mtok":..,
//   "output_usd_per_mtok":..,"default_latency_ms":..,"quality":{"code":0.9,..}}]}
// Unknown task names inside "quality" are reported as unknown_task_category.
struct CatalogLoadResult {
  bool         ok{true};
  ErrorCode    error{ErrorCode::none};
  std::string  detail;
  ModelCatalog catalog;
};
CatalogLoadResult catalog_from_json(const jsonlite::Object& doc);

}  // namespace routegate
