#include "docvec/core/clock.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace docvec::core {

std::string format_iso8601(const std::int64_t epoch_seconds) {
  const auto time_t_value = static_cast<std::time_t>(epoch_seconds);
  std::tm utc{};
  gmtime_r(&time_t_value, &utc);

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::int64_t SystemClock::now_epoch_seconds() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

std::string SystemClock::now_iso8601() {
  return format_iso8601(now_epoch_seconds());
}

std::int64_t FixedClock::now_epoch_seconds() {
  return epoch_seconds_;
}

std::string FixedClock::now_iso8601() {
  return format_iso8601(epoch_seconds_);
}

}  // namespace docvec::core
