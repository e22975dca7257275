#pragma once

// routegate/types.hpp — Core vocabulary for the routegate admission and routing engine.
//
// ARCHITECTURE NOTES:
//
// ERROR MODEL:
//   - No exceptions cross the public API. Fallible operations return a result
//     struct carrying {ok, ErrorCode, detail}. The wire form of an ErrorCode is
//     to_string(code), which is what every *_to_json() emits as "error_code".
//   - Three families (see is_admission_error() etc.):
//       admission     : recoverable by the caller retrying later
//       configuration : operator intervention required
//       selection     : fatal to the request, carries rejected candidates
//
// CONCURRENCY NOTES:
//   - All types in this header are value types. No shared state.
//
// EXTENSION_POINT: task_catalog
//   TaskCategory is a closed enum. Adding a category requires a wire name in
//   to_string()/parse_task_category() and a default min_perf in
//   default_min_perf(). Unknown wire names are rejected, never mapped to a
//   fallback category.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace routegate {

enum class ErrorCode {
  none,
  policy_not_found,
  invalid_policy,
  daily_budget_exceeded,
  request_cost_exceeds_limit,
  concurrency_limit_exceeded,
  rate_limited,
  token_limit_exceeded,
  no_eligible_model,
  unknown_task_category,
  reservation_not_found,
  json_parse_error,
  json_duplicate_key,
  config_invalid,
  io_error,
};

std::string to_string(ErrorCode code);

bool is_admission_error(ErrorCode code);
bool is_configuration_error(ErrorCode code);
bool is_selection_error(ErrorCode code);

// ---------------------------------------------------------------------------
// TaskCategory — closed set of request kinds the router understands
// ---------------------------------------------------------------------------
enum class TaskCategory {
  drafting_short,
  drafting_long,
  summarization,
  classification,
  extraction,
  analysis,
  code,
  chat,
};

// Wire name, e.g. "drafting-short".
std::string to_string(TaskCategory cat);
std::optional<TaskCategory> parse_task_category(const std::string& name);
const std::vector<TaskCategory>& all_task_categories();

// Quality floor applied when neither the policy nor the caller sets minPerf.
double default_min_perf(TaskCategory cat);

// ---------------------------------------------------------------------------
// ModelRef — provider/model pair, the unit of routing
// ---------------------------------------------------------------------------
struct ModelRef {
  std::string provider;
  std::string model;

  // "provider:model"
  std::string key() const { return provider + ":" + model; }

  bool operator==(const ModelRef& o) const {
    return provider == o.provider && model == o.model;
  }
  bool operator<(const ModelRef& o) const {
    return provider != o.provider ? provider < o.provider : model < o.model;
  }
};

// ---------------------------------------------------------------------------
// DenialStats — per-reason counters (admission / selection failures)
// ---------------------------------------------------------------------------
struct DenialStats {
  uint64_t daily_budget_exceeded{0};
  uint64_t request_cost_exceeds_limit{0};
  uint64_t concurrency_limit_exceeded{0};
  uint64_t rate_limited{0};
  uint64_t token_limit_exceeded{0};
  uint64_t no_eligible_model{0};
  uint64_t policy_errors{0};
  uint64_t other{0};

  void record(ErrorCode code);
  uint64_t total() const;
  std::string to_json() const;
};

}  // namespace routegate
