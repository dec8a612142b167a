#pragma once

#include <cstdint>
#include <string>

namespace docvec::core {

// Abstract clock interface for timestamp injection.
// Production code reads system time; tests pin "now" to exercise validity windows.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current time as whole seconds since the Unix epoch (UTC).
  virtual std::int64_t now_epoch_seconds() = 0;

  // Current timestamp in ISO 8601 format (UTC), used for audit records.
  // Contract: returned string is non-empty and valid ISO 8601.
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_epoch_seconds() override;
  std::string now_iso8601() override;
};

// Fixed clock: returns a pinned instant for deterministic tests and demos.
// The instant can be moved explicitly to walk across validity boundaries.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t epoch_seconds) : epoch_seconds_(epoch_seconds) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::int64_t now_epoch_seconds() override;
  std::string now_iso8601() override;

  void set_epoch_seconds(std::int64_t epoch_seconds) { epoch_seconds_ = epoch_seconds; }

 private:
  std::int64_t epoch_seconds_;
};

// format_iso8601 renders epoch seconds as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string format_iso8601(std::int64_t epoch_seconds);

}  // namespace docvec::core
