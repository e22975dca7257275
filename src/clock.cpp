#include "routegate/clock.hpp"

#include <cstdio>
#include <ctime>
#include <string>

namespace routegate {

std::shared_ptr<Clock> system_clock() {
  static std::shared_ptr<Clock> inst = std::make_shared<SystemClock>();
  return inst;
}

std::string day_to_iso(uint64_t day) {
  return unix_ms_to_iso(day * kMsPerDay).substr(0, 10);
}

std::string unix_ms_to_iso(uint64_t unix_ms) {
  const std::time_t secs = static_cast<std::time_t>(unix_ms / 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<unsigned>(unix_ms % 1000));
  return buf;
}

}  // namespace routegate
