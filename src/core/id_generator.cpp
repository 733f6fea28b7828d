#include "rxrecon/core/id_generator.h"

#include <chrono>
#include <cstdio>

namespace rxrecon::core {

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count();
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return std::string(prefix) + "-" + std::to_string(micros) + "-" + std::to_string(c);
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  unsigned long long sequence = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sequences_.find(prefix);
    if (it == sequences_.end()) {
      it = sequences_.emplace(std::string(prefix), 0).first;
    }
    sequence = ++it->second;
  }

  char digits[24];
  std::snprintf(digits, sizeof(digits), "%04llu", sequence);
  return std::string(prefix) + "-" + digits;
}

}  // namespace rxrecon::core
