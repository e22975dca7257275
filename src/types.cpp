#include "routegate/types.hpp"

#include <sstream>

namespace routegate {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::policy_not_found: return "policy_not_found";
    case ErrorCode::invalid_policy: return "invalid_policy";
    case ErrorCode::daily_budget_exceeded: return "daily_budget_exceeded";
    case ErrorCode::request_cost_exceeds_limit: return "request_cost_exceeds_limit";
    case ErrorCode::concurrency_limit_exceeded: return "concurrency_limit_exceeded";
    case ErrorCode::rate_limited: return "rate_limited";
    case ErrorCode::token_limit_exceeded: return "token_limit_exceeded";
    case ErrorCode::no_eligible_model: return "no_eligible_model";
    case ErrorCode::unknown_task_category: return "unknown_task_category";
    case ErrorCode::reservation_not_found: return "reservation_not_found";
    case ErrorCode::json_parse_error: return "json_parse_error";
    case ErrorCode::json_duplicate_key: return "json_duplicate_key";
    case ErrorCode::config_invalid: return "config_invalid";
    case ErrorCode::io_error: return "io_error";
  }
  return "";
}

bool is_admission_error(ErrorCode code) {
  return code == ErrorCode::daily_budget_exceeded ||
         code == ErrorCode::request_cost_exceeds_limit ||
         code == ErrorCode::concurrency_limit_exceeded ||
         code == ErrorCode::rate_limited ||
         code == ErrorCode::token_limit_exceeded;
}

bool is_configuration_error(ErrorCode code) {
  return code == ErrorCode::policy_not_found ||
         code == ErrorCode::invalid_policy ||
         code == ErrorCode::config_invalid;
}

bool is_selection_error(ErrorCode code) {
  return code == ErrorCode::no_eligible_model;
}

// ---------------------------------------------------------------------------
// TaskCategory
// ---------------------------------------------------------------------------

std::string to_string(TaskCategory cat) {
  switch (cat) {
    case TaskCategory::drafting_short: return "drafting-short";
    case TaskCategory::drafting_long: return "drafting-long";
    case TaskCategory::summarization: return "summarization";
    case TaskCategory::classification: return "classification";
    case TaskCategory::extraction: return "extraction";
    case TaskCategory::analysis: return "analysis";
    case TaskCategory::code: return "code";
    case TaskCategory::chat: return "chat";
  }
  return "";
}

const std::vector<TaskCategory>& all_task_categories() {
  static const std::vector<TaskCategory> kAll = {
      TaskCategory::drafting_short, TaskCategory::drafting_long,
      TaskCategory::summarization,  TaskCategory::classification,
      TaskCategory::extraction,     TaskCategory::analysis,
      TaskCategory::code,           TaskCategory::chat,
  };
  return kAll;
}

std::optional<TaskCategory> parse_task_category(const std::string& name) {
  for (TaskCategory c : all_task_categories()) {
    if (to_string(c) == name) return c;
  }
  return std::nullopt;
}

double default_min_perf(TaskCategory cat) {
  switch (cat) {
    case TaskCategory::drafting_short: return 0.5;
    case TaskCategory::drafting_long: return 0.7;
    case TaskCategory::summarization: return 0.6;
    case TaskCategory::classification: return 0.5;
    case TaskCategory::extraction: return 0.6;
    case TaskCategory::analysis: return 0.8;
    case TaskCategory::code: return 0.8;
    case TaskCategory::chat: return 0.5;
  }
  return 0.5;
}

// ---------------------------------------------------------------------------
// DenialStats
// ---------------------------------------------------------------------------

void DenialStats::record(ErrorCode code) {
  switch (code) {
    case ErrorCode::daily_budget_exceeded: ++daily_budget_exceeded; break;
    case ErrorCode::request_cost_exceeds_limit: ++request_cost_exceeds_limit; break;
    case ErrorCode::concurrency_limit_exceeded: ++concurrency_limit_exceeded; break;
    case ErrorCode::rate_limited: ++rate_limited; break;
    case ErrorCode::token_limit_exceeded: ++token_limit_exceeded; break;
    case ErrorCode::no_eligible_model: ++no_eligible_model; break;
    case ErrorCode::policy_not_found:
    case ErrorCode::invalid_policy: ++policy_errors; break;
    case ErrorCode::none: break;
    default: ++other; break;
  }
}

uint64_t DenialStats::total() const {
  return daily_budget_exceeded + request_cost_exceeds_limit +
         concurrency_limit_exceeded + rate_limited + token_limit_exceeded +
         no_eligible_model + policy_errors + other;
}

std::string DenialStats::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"daily_budget_exceeded\":" << daily_budget_exceeded
    << ",\"request_cost_exceeds_limit\":" << request_cost_exceeds_limit
    << ",\"concurrency_limit_exceeded\":" << concurrency_limit_exceeded
    << ",\"rate_limited\":" << rate_limited
    << ",\"token_limit_exceeded\":" << token_limit_exceeded
    << ",\"no_eligible_model\":" << no_eligible_model
    << ",\"policy_errors\":" << policy_errors
    << ",\"other\":" << other
    << "}";
  return o.str();
}

}  // namespace routegate
