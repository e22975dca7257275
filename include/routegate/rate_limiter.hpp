#pragma once

// routegate/rate_limiter.hpp — Fixed-window burst and sustained limits per organization.
//
// DESIGN:
//   Two fixed windows per organization, evaluated in order: burst (10 s by
//   default) then sustained (60 s). A request is admitted only when both
//   windows have room; it is then counted in both. A denied request is
//   counted in neither.
//
// INVARIANTS:
//   1. ATOMIC: the capacity check and the increment happen under the
//      organization's mutex. `count` never exceeds the limit.
//   2. MONOTONIC TIME: windows run on Clock::monotonic_ms(). Wall-clock steps
//      cannot reopen or stretch a window.
//   3. ROLLOVER: a window whose start is at least `window_ms` in the past is
//      reset by the next request, whose increment establishes the new
//      window_start.
//   4. REFUND: a refund names the window starts recorded at admission, so a
//      request admitted in an earlier window never frees a slot in the
//      current one.
//
// EXTENSION_POINT: shared_counter_store
//   Multi-instance deployments replace OrgWindows with a compare-and-swap
//   counter in a shared key-value store, keyed "<org>:<window>:<start>".

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "routegate/clock.hpp"
#include "routegate/config.hpp"
#include "routegate/types.hpp"

namespace routegate {

enum class RateWindowKind { burst, sustained };

std::string to_string(RateWindowKind k);

struct RateDecision {
  bool        allowed{true};
  ErrorCode   error{ErrorCode::none};
  std::string window;            // which window denied ("burst" | "sustained")
  uint64_t    retry_after_ms{0};
  uint32_t    burst_count{0};    // counts after this call
  uint32_t    sustained_count{0};
  uint64_t    burst_window_start_ms{0};      // windows this request was counted in
  uint64_t    sustained_window_start_ms{0};

  std::string to_json() const;
};

struct RateWindowState {
  uint64_t window_start_ms{0};
  uint32_t count{0};
};

class RateLimiter {
 public:
  explicit RateLimiter(RateConfig cfg = {}, std::shared_ptr<Clock> clock = nullptr);

  RateDecision check_and_increment(const std::string& org_id, uint32_t burst_limit,
                                   uint32_t sustained_limit);

  // Returns an admitted request's slot (later denial or cancellation). Each
  // window is decremented only if it is still the window the request was
  // counted in; a rolled window already forgot the request.
  void refund(const std::string& org_id, const RateDecision& admitted);

  RateWindowState window(const std::string& org_id, RateWindowKind kind) const;

  void reset(const std::string& org_id);

 private:
  struct OrgWindows {
    std::mutex mu;
    RateWindowState burst;
    RateWindowState sustained;
  };

  std::shared_ptr<OrgWindows> windows_for(const std::string& org_id) const;

  RateConfig cfg_;
  std::shared_ptr<Clock> clock_;
  mutable std::mutex map_mu_;
  mutable std::unordered_map<std::string, std::shared_ptr<OrgWindows>> orgs_;
};

}  // namespace routegate
