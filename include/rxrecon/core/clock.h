#pragma once

#include <string>

namespace rxrecon::core {

// Abstract clock interface for timestamp injection.
// Reconciliation uses it for audit timestamps and for the default "as of" date
// used by lot-expiry checks, so tests pin it with FixedClock.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current timestamp in ISO 8601 format (UTC), e.g. "2026-03-01T09:30:00Z".
  // Contract: returned string is non-empty and starts with YYYY-MM-DD.
  virtual std::string now_iso8601() = 0;

  // Calendar date part of now_iso8601().
  std::string today_iso() {
    const std::string now = now_iso8601();
    return now.substr(0, 10);
  }

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::string now_iso8601() override;
};

// FixedClock returns the same instant on every call.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::string now_iso8601() override { return fixed_time_; }

 private:
  std::string fixed_time_;
};

}  // namespace rxrecon::core
