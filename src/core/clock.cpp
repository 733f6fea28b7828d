#include "rxrecon/core/clock.h"

#include <chrono>
#include <ctime>

namespace rxrecon::core {

std::string SystemClock::now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return std::string(buffer, written);
}

}  // namespace rxrecon::core
