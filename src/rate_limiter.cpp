#include "routegate/rate_limiter.hpp"

#include <sstream>

namespace routegate {

namespace {

// Rolls the window over if `now` is past its end. A fresh window has
// window_start 0 until its first increment.
void roll(RateWindowState& w, uint64_t now, uint64_t window_ms) {
  if (w.count > 0 && now >= w.window_start_ms + window_ms) {
    w.window_start_ms = 0;
    w.count = 0;
  }
}

uint64_t retry_after(const RateWindowState& w, uint64_t now, uint64_t window_ms) {
  const uint64_t end = w.window_start_ms + window_ms;
  return end > now ? end - now : 0;
}

void admit(RateWindowState& w, uint64_t now) {
  if (w.count == 0) w.window_start_ms = now;
  ++w.count;
}

}  // namespace

std::string to_string(RateWindowKind k) {
  switch (k) {
    case RateWindowKind::burst: return "burst";
    case RateWindowKind::sustained: return "sustained";
  }
  return "burst";
}

std::string RateDecision::to_json() const {
  std::ostringstream o;
  o << "{\"allowed\":" << (allowed ? "true" : "false");
  if (!allowed) {
    o << ",\"error_code\":\"" << to_string(error) << "\""
      << ",\"window\":\"" << window << "\""
      << ",\"retry_after_ms\":" << retry_after_ms;
  }
  o << ",\"burst_count\":" << burst_count
    << ",\"sustained_count\":" << sustained_count << "}";
  return o.str();
}

RateLimiter::RateLimiter(RateConfig cfg, std::shared_ptr<Clock> clock)
    : cfg_(cfg), clock_(clock ? std::move(clock) : system_clock()) {}

std::shared_ptr<RateLimiter::OrgWindows> RateLimiter::windows_for(const std::string& org_id) const {
  std::lock_guard<std::mutex> lk(map_mu_);
  auto& slot = orgs_[org_id];
  if (!slot) slot = std::make_shared<OrgWindows>();
  return slot;
}

RateDecision RateLimiter::check_and_increment(const std::string& org_id, uint32_t burst_limit,
                                              uint32_t sustained_limit) {
  auto w = windows_for(org_id);
  const uint64_t now = clock_->monotonic_ms();

  std::lock_guard<std::mutex> lk(w->mu);
  roll(w->burst, now, cfg_.burst_window_ms);
  roll(w->sustained, now, cfg_.sustained_window_ms);

  RateDecision d;
  if (w->burst.count >= burst_limit) {
    d.allowed = false;
    d.error = ErrorCode::rate_limited;
    d.window = "burst";
    d.retry_after_ms = retry_after(w->burst, now, cfg_.burst_window_ms);
  } else if (w->sustained.count >= sustained_limit) {
    d.allowed = false;
    d.error = ErrorCode::rate_limited;
    d.window = "sustained";
    d.retry_after_ms = retry_after(w->sustained, now, cfg_.sustained_window_ms);
  } else {
    admit(w->burst, now);
    admit(w->sustained, now);
    d.burst_window_start_ms = w->burst.window_start_ms;
    d.sustained_window_start_ms = w->sustained.window_start_ms;
  }
  d.burst_count = w->burst.count;
  d.sustained_count = w->sustained.count;
  return d;
}

void RateLimiter::refund(const std::string& org_id, const RateDecision& admitted) {
  if (!admitted.allowed) return;
  auto w = windows_for(org_id);
  const uint64_t now = clock_->monotonic_ms();
  std::lock_guard<std::mutex> lk(w->mu);
  roll(w->burst, now, cfg_.burst_window_ms);
  roll(w->sustained, now, cfg_.sustained_window_ms);
  if (w->burst.count > 0 && w->burst.window_start_ms == admitted.burst_window_start_ms) --w->burst.count;
  if (w->sustained.count > 0 && w->sustained.window_start_ms == admitted.sustained_window_start_ms) {
    --w->sustained.count;
  }
}

RateWindowState RateLimiter::window(const std::string& org_id, RateWindowKind kind) const {
  auto w = windows_for(org_id);
  const uint64_t now = clock_->monotonic_ms();
  std::lock_guard<std::mutex> lk(w->mu);
  roll(w->burst, now, cfg_.burst_window_ms);
  roll(w->sustained, now, cfg_.sustained_window_ms);
  return kind == RateWindowKind::burst ? w->burst : w->sustained;
}

void RateLimiter::reset(const std::string& org_id) {
  auto w = windows_for(org_id);
  std::lock_guard<std::mutex> lk(w->mu);
  w->burst = RateWindowState{};
  w->sustained = RateWindowState{};
}

}  // namespace routegate
