#include "routegate/usage_ledger.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>

#include "routegate/hash.hpp"
#include "routegate/jsonlite.hpp"

namespace routegate {

namespace {

namespace jl = jsonlite;

// Absorbs binary rounding in sums like 100 x 0.0199.
constexpr double kCostEpsilon = 1e-9;

std::string fd(double d) { return jl::format_double(d); }

BudgetDecision deny(ErrorCode code, std::string detail, double remaining) {
  BudgetDecision d;
  d.ok = false;
  d.error = code;
  d.detail = std::move(detail);
  d.remaining_usd = remaining;
  return d;
}

std::string usd(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "$%.4f", v);
  return buf;
}

}  // namespace

std::string to_string(BudgetStatus s) {
  switch (s) {
    case BudgetStatus::normal: return "normal";
    case BudgetStatus::warning: return "warning";
    case BudgetStatus::critical: return "critical";
    case BudgetStatus::exceeded: return "exceeded";
  }
  return "normal";
}

BudgetStatus budget_status(double spent_usd, double max_daily_usd) {
  if (max_daily_usd <= 0.0) return BudgetStatus::exceeded;
  const double ratio = spent_usd / max_daily_usd;
  if (ratio >= 1.0 - kCostEpsilon) return BudgetStatus::exceeded;
  if (ratio >= 0.95) return BudgetStatus::critical;
  if (ratio >= 0.80) return BudgetStatus::warning;
  return BudgetStatus::normal;
}

std::string UsageSnapshot::to_json() const {
  std::ostringstream o;
  o << "{\"organization_id\":\"" << jl::escape(organization_id) << "\""
    << ",\"date\":\"" << date << "\""
    << ",\"committed_usd\":" << fd(committed_usd)
    << ",\"reserved_usd\":" << fd(reserved_usd)
    << ",\"in_flight\":" << in_flight
    << ",\"request_count\":" << request_count
    << ",\"max_daily_cost_usd\":" << fd(max_daily_cost_usd)
    << ",\"percent_used\":" << fd(percent_used)
    << ",\"remaining_usd\":" << fd(remaining_usd)
    << ",\"status\":\"" << to_string(status) << "\"}";
  return o.str();
}

std::string BudgetDecision::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false");
  if (ok) {
    o << ",\"reservation_id\":\"" << reservation.id << "\""
      << ",\"estimated_cost_usd\":" << fd(reservation.estimated_cost_usd)
      << ",\"projected_status\":\"" << to_string(projected_status) << "\"";
  } else {
    o << ",\"error_code\":\"" << to_string(error) << "\""
      << ",\"detail\":\"" << jl::escape(detail) << "\"";
  }
  o << ",\"remaining_usd\":" << fd(remaining_usd) << "}";
  return o.str();
}

std::string CommitResult::to_json() const {
  std::ostringstream o;
  o << "{\"ok\":" << (ok ? "true" : "false");
  if (!ok) {
    o << ",\"error_code\":\"" << to_string(error) << "\""
      << ",\"detail\":\"" << jl::escape(detail) << "\"";
  }
  o << ",\"organization_id\":\"" << jl::escape(organization_id) << "\""
    << ",\"charged_usd\":" << fd(charged_usd)
    << ",\"delta_usd\":" << fd(delta_usd) << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// UsageLedger
// ---------------------------------------------------------------------------

UsageLedger::UsageLedger(std::shared_ptr<Clock> clock)
    : clock_(clock ? std::move(clock) : system_clock()) {}

std::shared_ptr<UsageLedger::OrgLedger> UsageLedger::ledger_for(const std::string& org_id) const {
  std::lock_guard<std::mutex> lk(map_mu_);
  auto& slot = orgs_[org_id];
  if (!slot) slot = std::make_shared<OrgLedger>();
  return slot;
}

std::shared_ptr<UsageLedger::OrgLedger> UsageLedger::ledger_for_reservation(
    const std::string& reservation_id) const {
  std::lock_guard<std::mutex> lk(map_mu_);
  auto owner = reservation_owner_.find(reservation_id);
  if (owner == reservation_owner_.end()) return nullptr;
  auto it = orgs_.find(owner->second);
  return it == orgs_.end() ? nullptr : it->second;
}

void UsageLedger::roll_day(OrgLedger& l) const {
  const uint64_t today = day_index(clock_->unix_ms());
  if (l.day == today) return;
  if (l.day != 0 && (l.daily_cost > 0.0 || l.request_count > 0)) {
    l.closed_days.push_front(DailyUsage{day_to_iso(l.day), l.daily_cost, l.request_count});
    while (l.closed_days.size() > kHistoryDays) l.closed_days.pop_back();
  }
  l.day = today;
  l.daily_cost = 0.0;
  l.request_count = 0;
}

BudgetDecision UsageLedger::check_and_reserve(const Policy& policy, double estimated_cost_usd) {
  const double estimate = std::max(0.0, estimated_cost_usd);
  auto ledger = ledger_for(policy.organization_id);
  std::string id;
  BudgetDecision d;
  {
    std::lock_guard<std::mutex> lk(ledger->mu);
    roll_day(*ledger);
    const double committed_and_reserved = ledger->daily_cost + ledger->reserved;
    const double remaining = std::max(0.0, policy.max_daily_cost_usd - committed_and_reserved);

    // Per-request cap is checked and reported first.
    if (estimate > policy.max_request_cost_usd + kCostEpsilon) {
      return deny(ErrorCode::request_cost_exceeds_limit,
                  "estimated cost " + usd(estimate) + " exceeds per-request limit " +
                      usd(policy.max_request_cost_usd),
                  remaining);
    }
    if (budget_status(ledger->daily_cost, policy.max_daily_cost_usd) == BudgetStatus::exceeded ||
        committed_and_reserved + estimate > policy.max_daily_cost_usd + kCostEpsilon) {
      return deny(ErrorCode::daily_budget_exceeded,
                  "daily budget " + usd(policy.max_daily_cost_usd) + " would be exceeded (spent " +
                      usd(ledger->daily_cost) + ", reserved " + usd(ledger->reserved) +
                      ", request " + usd(estimate) + ")",
                  remaining);
    }
    if (ledger->in_flight >= policy.max_concurrent_jobs) {
      return deny(ErrorCode::concurrency_limit_exceeded,
                  std::to_string(ledger->in_flight) + " jobs in flight, limit " +
                      std::to_string(policy.max_concurrent_jobs),
                  remaining);
    }

    const uint64_t now = clock_->unix_ms();
    const std::string material = policy.organization_id + ":" + std::to_string(ledger->day) + ":" +
                                 std::to_string(++ledger->seq) + ":" + std::to_string(now);
    id = "rsv-" + reservation_id_hash(material).substr(0, 32);

    Reservation r{id, policy.organization_id, estimate, now};
    ledger->reservations.emplace(id, r);
    ledger->reserved += estimate;
    ++ledger->in_flight;

    d.reservation = r;
    d.projected_status = budget_status(ledger->daily_cost + ledger->reserved, policy.max_daily_cost_usd);
    d.remaining_usd = std::max(0.0, policy.max_daily_cost_usd - ledger->daily_cost - ledger->reserved);
  }
  std::lock_guard<std::mutex> lk(map_mu_);
  reservation_owner_[id] = policy.organization_id;
  return d;
}

BudgetDecision UsageLedger::amend(const std::string& reservation_id, const Policy& policy,
                                  double new_estimate_usd) {
  auto ledger = ledger_for_reservation(reservation_id);
  if (!ledger) return deny(ErrorCode::reservation_not_found, "unknown reservation " + reservation_id, 0.0);

  const double estimate = std::max(0.0, new_estimate_usd);
  std::lock_guard<std::mutex> lk(ledger->mu);
  roll_day(*ledger);
  auto it = ledger->reservations.find(reservation_id);
  if (it == ledger->reservations.end()) {
    return deny(ErrorCode::reservation_not_found, "unknown reservation " + reservation_id, 0.0);
  }
  const double delta = estimate - it->second.estimated_cost_usd;
  const double remaining_before =
      std::max(0.0, policy.max_daily_cost_usd - ledger->daily_cost - ledger->reserved);

  if (estimate > policy.max_request_cost_usd + kCostEpsilon) {
    return deny(ErrorCode::request_cost_exceeds_limit,
                "estimated cost " + usd(estimate) + " exceeds per-request limit " +
                    usd(policy.max_request_cost_usd),
                remaining_before);
  }
  if (delta > 0.0 &&
      ledger->daily_cost + ledger->reserved + delta > policy.max_daily_cost_usd + kCostEpsilon) {
    return deny(ErrorCode::daily_budget_exceeded,
                "daily budget " + usd(policy.max_daily_cost_usd) + " would be exceeded by selected model",
                remaining_before);
  }

  ledger->reserved = std::max(0.0, ledger->reserved + delta);
  it->second.estimated_cost_usd = estimate;

  BudgetDecision d;
  d.reservation = it->second;
  d.projected_status = budget_status(ledger->daily_cost + ledger->reserved, policy.max_daily_cost_usd);
  d.remaining_usd = std::max(0.0, policy.max_daily_cost_usd - ledger->daily_cost - ledger->reserved);
  return d;
}

CommitResult UsageLedger::settle(const std::string& reservation_id, std::optional<double> actual_cost_usd) {
  CommitResult r;
  auto ledger = ledger_for_reservation(reservation_id);
  if (!ledger) {
    r.ok = false;
    r.error = ErrorCode::reservation_not_found;
    r.detail = "unknown reservation " + reservation_id;
    return r;
  }
  {
    std::lock_guard<std::mutex> lk(ledger->mu);
    roll_day(*ledger);
    auto it = ledger->reservations.find(reservation_id);
    if (it == ledger->reservations.end()) {
      r.ok = false;
      r.error = ErrorCode::reservation_not_found;
      r.detail = "reservation already settled: " + reservation_id;
      return r;
    }
    const Reservation res = it->second;
    ledger->reservations.erase(it);
    ledger->reserved = std::max(0.0, ledger->reserved - res.estimated_cost_usd);
    if (ledger->reservations.empty()) ledger->reserved = 0.0;
    if (ledger->in_flight > 0) --ledger->in_flight;

    r.organization_id = res.organization_id;
    if (actual_cost_usd) {
      const double actual = std::max(0.0, *actual_cost_usd);
      ledger->daily_cost += actual;
      ++ledger->request_count;
      r.charged_usd = actual;
      r.delta_usd = actual - res.estimated_cost_usd;
    }
  }
  std::lock_guard<std::mutex> lk(map_mu_);
  reservation_owner_.erase(reservation_id);
  return r;
}

CommitResult UsageLedger::commit(const std::string& reservation_id, double actual_cost_usd) {
  return settle(reservation_id, actual_cost_usd);
}

CommitResult UsageLedger::release(const std::string& reservation_id) {
  return settle(reservation_id, std::nullopt);
}

std::optional<Reservation> UsageLedger::find_reservation(const std::string& reservation_id) const {
  auto ledger = ledger_for_reservation(reservation_id);
  if (!ledger) return std::nullopt;
  std::lock_guard<std::mutex> lk(ledger->mu);
  auto it = ledger->reservations.find(reservation_id);
  if (it == ledger->reservations.end()) return std::nullopt;
  return it->second;
}

UsageSnapshot UsageLedger::usage(const Policy& policy) const {
  auto ledger = ledger_for(policy.organization_id);
  std::lock_guard<std::mutex> lk(ledger->mu);
  roll_day(*ledger);
  UsageSnapshot s;
  s.organization_id = policy.organization_id;
  s.date = day_to_iso(ledger->day);
  s.committed_usd = ledger->daily_cost;
  s.reserved_usd = ledger->reserved;
  s.in_flight = ledger->in_flight;
  s.request_count = ledger->request_count;
  s.max_daily_cost_usd = policy.max_daily_cost_usd;
  s.percent_used = policy.max_daily_cost_usd > 0.0
                       ? ledger->daily_cost / policy.max_daily_cost_usd * 100.0
                       : 100.0;
  s.remaining_usd = std::max(0.0, policy.max_daily_cost_usd - ledger->daily_cost - ledger->reserved);
  s.status = budget_status(ledger->daily_cost, policy.max_daily_cost_usd);
  return s;
}

std::vector<DailyUsage> UsageLedger::history(const std::string& org_id, uint32_t days) const {
  auto ledger = ledger_for(org_id);
  std::lock_guard<std::mutex> lk(ledger->mu);
  roll_day(*ledger);
  std::vector<DailyUsage> out;
  for (const auto& d : ledger->closed_days) {
    if (out.size() >= days) break;
    out.push_back(d);
  }
  return out;
}

void UsageLedger::record_spend(const std::string& org_id, double cost_usd, uint64_t requests) {
  auto ledger = ledger_for(org_id);
  std::lock_guard<std::mutex> lk(ledger->mu);
  roll_day(*ledger);
  ledger->daily_cost += std::max(0.0, cost_usd);
  ledger->request_count += requests;
}

size_t UsageLedger::open_reservations() const {
  std::lock_guard<std::mutex> lk(map_mu_);
  return reservation_owner_.size();
}

// ---------------------------------------------------------------------------
// Compliance / summary
// ---------------------------------------------------------------------------

std::string ComplianceReport::to_json() const {
  std::ostringstream o;
  o << "{\"compliant\":" << (compliant ? "true" : "false") << ",\"violations\":[";
  for (size_t i = 0; i < violations.size(); ++i) {
    if (i) o << ",";
    o << "\"" << jl::escape(violations[i]) << "\"";
  }
  o << "]}";
  return o.str();
}

ComplianceReport check_policy_compliance(const Policy& policy, const UsageSnapshot& usage) {
  ComplianceReport r;
  if (usage.committed_usd > policy.max_daily_cost_usd + kCostEpsilon) {
    r.violations.push_back("daily spend (" + usd(usage.committed_usd) + ") exceeds limit (" +
                           usd(policy.max_daily_cost_usd) + ")");
  }
  if (usage.in_flight > policy.max_concurrent_jobs) {
    r.violations.push_back("in-flight jobs (" + std::to_string(usage.in_flight) + ") exceed limit (" +
                           std::to_string(policy.max_concurrent_jobs) + ")");
  }
  r.compliant = r.violations.empty();
  return r;
}

std::string policy_summary_json(const Policy& policy, const UsageSnapshot& usage) {
  std::ostringstream o;
  o << "{\"organization_id\":\"" << jl::escape(policy.organization_id) << "\""
    << ",\"trial_mode\":" << (policy.trial_mode ? "true" : "false")
    << ",\"max_daily_cost_usd\":" << fd(policy.max_daily_cost_usd)
    << ",\"max_request_cost_usd\":" << fd(policy.max_request_cost_usd)
    << ",\"allowed_providers\":[";
  for (size_t i = 0; i < policy.allowed_providers.size(); ++i) {
    if (i) o << ",";
    o << "\"" << jl::escape(policy.allowed_providers[i]) << "\"";
  }
  o << "],\"task_override_count\":" << policy.task_overrides.size()
    << ",\"usage\":" << usage.to_json()
    << ",\"compliance\":" << check_policy_compliance(policy, usage).to_json() << "}";
  return o.str();
}

}  // namespace routegate
