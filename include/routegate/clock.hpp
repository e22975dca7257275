#pragma once

// routegate/clock.hpp — Time sources.
//
// Two clocks, never mixed:
//   monotonic_ms(): rate-limit windows, circuit cool-downs, cache TTLs.
//                    Immune to wall-clock steps (NTP slew, manual changes).
//   unix_ms()     : calendar day of the usage ledger, telemetry bucket
//                    boundaries, decision timestamps.
//
// ManualClock exists so that window rollover, cool-down and day rollover can
// be exercised deterministically in tests and in `routegate simulate`.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace routegate {

class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t monotonic_ms() const = 0;
  virtual uint64_t unix_ms() const = 0;
};

class SystemClock : public Clock {
 public:
  uint64_t monotonic_ms() const override {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
  }
  uint64_t unix_ms() const override {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
  }
};

// Thread-safe. Both readings advance together.
class ManualClock : public Clock {
 public:
  explicit ManualClock(uint64_t unix_start_ms = 1700000000000ULL)
      : mono_(1000), unix_(unix_start_ms) {}

  uint64_t monotonic_ms() const override { return mono_.load(std::memory_order_acquire); }
  uint64_t unix_ms() const override { return unix_.load(std::memory_order_acquire); }

  void advance_ms(uint64_t ms) {
    mono_.fetch_add(ms, std::memory_order_acq_rel);
    unix_.fetch_add(ms, std::memory_order_acq_rel);
  }

 private:
  std::atomic<uint64_t> mono_;
  std::atomic<uint64_t> unix_;
};

std::shared_ptr<Clock> system_clock();

constexpr uint64_t kMsPerHour = 3600ULL * 1000ULL;
constexpr uint64_t kMsPerDay = 24ULL * kMsPerHour;

// UTC day number since the epoch.
inline uint64_t day_index(uint64_t unix_ms) { return unix_ms / kMsPerDay; }

// "YYYY-MM-DD" for a UTC day index.
std::string day_to_iso(uint64_t day);
// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string unix_ms_to_iso(uint64_t unix_ms);

}  // namespace routegate
