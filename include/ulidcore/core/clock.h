#pragma once

#include <cstdint>

namespace ulidcore::core {

// Abstract clock interface for timestamp injection.
// Production code reads the wall clock; tests and demos pin a fixed instant.
class IClock {
 public:
  virtual ~IClock() = default;

  // Milliseconds since the Unix epoch (UTC).
  virtual std::int64_t now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: std::chrono::system_clock. Stateless and thread-safe.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::int64_t now_unix_millis() override;
};

// Fixed clock: returns a constant instant for deterministic tests/demos.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::int64_t fixed_millis) : fixed_millis_(fixed_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::int64_t now_unix_millis() override;

 private:
  std::int64_t fixed_millis_;
};

}  // namespace ulidcore::core
