#pragma once

// routegate/usage_ledger.hpp — Per-organization daily spend and the budget gate.
//
// DESIGN:
//   One OrgLedger per organization, created lazily and owned by the
//   UsageLedger. Every mutation of an organization's counters runs under that
//   organization's mutex; there is no lock shared across organizations.
//
//   Admission reserves the estimate up front (check_and_reserve). The provider
//   call happens with no ledger lock held. The caller then reconciles with
//   commit(actual) or, on cancellation, release(). A reservation is consumed
//   exactly once.
//
// INVARIANTS:
//   1. LINEARIZABLE: for one organization, the check and the reservation are
//      one critical section. Two concurrent requests can never both pass a
//      check that would jointly exceed max_daily_cost_usd.
//   2. MONOTONIC: committed daily cost is never decremented. Refunds only
//      shrink the outstanding reservation.
//   3. BOUNDED OVERSHOOT: committed + reserved <= max_daily_cost_usd at every
//      admission. Only commit(actual > estimate) can push committed spend past
//      the ceiling, by at most that request's estimate-vs-actual slack.
//   4. STATUS IS DERIVED: budget status is recomputed from the counters on
//      every read and never stored.
//
// DAY ROLLOVER:
//   Counters are keyed by UTC day (Clock::unix_ms). The first access on a new
//   day closes the previous one into history (30 days kept). Outstanding
//   reservations and the in-flight count carry over; a reservation committed
//   after midnight is charged to the new day.
//
// EXTENSION_POINT: durable_counter_store
//   Current: in-process counters (state is lost on restart).
//   Upgrade: back OrgLedger with a `daily_usage` table and perform the
//   check+reserve as a conditional increment (increment-then-verify, rolling
//   back on overshoot). The public contract does not change.

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "routegate/clock.hpp"
#include "routegate/policy.hpp"
#include "routegate/types.hpp"

namespace routegate {

enum class BudgetStatus { normal, warning, critical, exceeded };

std::string to_string(BudgetStatus s);

// normal < 80% <= warning < 95% <= critical < 100% <= exceeded
BudgetStatus budget_status(double spent_usd, double max_daily_usd);

struct Reservation {
  std::string id;
  std::string organization_id;
  double      estimated_cost_usd{0.0};
  uint64_t    created_unix_ms{0};
};

struct UsageSnapshot {
  std::string  organization_id;
  std::string  date;                 // UTC day, YYYY-MM-DD
  double       committed_usd{0.0};
  double       reserved_usd{0.0};
  uint32_t     in_flight{0};
  uint64_t     request_count{0};
  double       max_daily_cost_usd{0.0};
  double       percent_used{0.0};    // committed / max * 100
  double       remaining_usd{0.0};   // max - committed - reserved, floored at 0
  BudgetStatus status{BudgetStatus::normal};

  std::string to_json() const;
};

struct DailyUsage {
  std::string date;
  double      cost_usd{0.0};
  uint64_t    request_count{0};
};

struct BudgetDecision {
  bool         ok{true};
  ErrorCode    error{ErrorCode::none};
  std::string  detail;
  Reservation  reservation;
  // Status projected over committed + reserved (including this request).
  BudgetStatus projected_status{BudgetStatus::normal};
  double       remaining_usd{0.0};

  std::string to_json() const;
};

struct CommitResult {
  bool          ok{true};
  ErrorCode     error{ErrorCode::none};
  std::string   detail;
  double        charged_usd{0.0};
  double        delta_usd{0.0};      // actual - estimate
  std::string   organization_id;

  std::string to_json() const;
};

class UsageLedger {
 public:
  explicit UsageLedger(std::shared_ptr<Clock> clock = nullptr);

  // Checks, in order: per-request cap, daily budget, concurrency.
  // On success the estimate is reserved and one in-flight slot is held.
  BudgetDecision check_and_reserve(const Policy& policy, double estimated_cost_usd);

  // Replace a reservation's estimate, re-checking the daily budget atomically
  // when it grows. On denial the original reservation is left untouched.
  BudgetDecision amend(const std::string& reservation_id, const Policy& policy,
                       double new_estimate_usd);

  // Charge actual cost, drop the reservation, free the in-flight slot.
  CommitResult commit(const std::string& reservation_id, double actual_cost_usd);

  // Compensating release for a cancelled request. Charges nothing.
  CommitResult release(const std::string& reservation_id);

  std::optional<Reservation> find_reservation(const std::string& reservation_id) const;

  UsageSnapshot usage(const Policy& policy) const;

  // Closed days, most recent first, at most `days` entries (<= 30 kept).
  std::vector<DailyUsage> history(const std::string& org_id, uint32_t days) const;

  // Books spend that did not go through a reservation (imports, replays).
  void record_spend(const std::string& org_id, double cost_usd, uint64_t requests = 1);

  size_t open_reservations() const;

  static constexpr size_t kHistoryDays = 30;

 private:
  struct OrgLedger {
    std::mutex mu;
    uint64_t day{0};
    double daily_cost{0.0};
    uint64_t request_count{0};
    double reserved{0.0};
    uint32_t in_flight{0};
    uint64_t seq{0};
    std::deque<DailyUsage> closed_days;   // most recent at front
    std::unordered_map<std::string, Reservation> reservations;
  };

  std::shared_ptr<OrgLedger> ledger_for(const std::string& org_id) const;
  std::shared_ptr<OrgLedger> ledger_for_reservation(const std::string& reservation_id) const;
  void roll_day(OrgLedger& l) const;
  CommitResult settle(const std::string& reservation_id, std::optional<double> actual_cost_usd);

  std::shared_ptr<Clock> clock_;
  mutable std::mutex map_mu_;
  mutable std::unordered_map<std::string, std::shared_ptr<OrgLedger>> orgs_;
  std::unordered_map<std::string, std::string> reservation_owner_;   // id -> org, under map_mu_
};

// ---------------------------------------------------------------------------
// Policy compliance and summary (admin reads)
// ---------------------------------------------------------------------------
struct ComplianceReport {
  bool compliant{true};
  std::vector<std::string> violations;

  std::string to_json() const;
};

ComplianceReport check_policy_compliance(const Policy& policy, const UsageSnapshot& usage);

// {"organization_id","trial_mode","max_daily_cost_usd","max_request_cost_usd",
//  "allowed_providers","task_override_count","usage":{...}}
std::string policy_summary_json(const Policy& policy, const UsageSnapshot& usage);

}  // namespace routegate
