#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ulidcore::core {

// Abstract source of random bytes for the identifier's random field.
class IEntropySource {
 public:
  virtual ~IEntropySource() = default;

  // Return exactly `count` bytes.
  // Contract: failures (e.g. an exhausted or unavailable system source) throw;
  // a short or partially filled buffer is never returned.
  virtual std::vector<std::uint8_t> bytes(std::size_t count) = 0;

 protected:
  IEntropySource() = default;
  IEntropySource(const IEntropySource&) = default;
  IEntropySource& operator=(const IEntropySource&) = default;
  IEntropySource(IEntropySource&&) = default;
  IEntropySource& operator=(IEntropySource&&) = default;
};

// Production source: std::random_device, one instance per thread.
// On Linux/libstdc++ this reads the kernel CSPRNG (getrandom or /dev/urandom).
// Never seeds a deterministic engine. Thread-safe; holds no shared state.
// Throws std::system_error if the device cannot be opened or read.
class SystemEntropySource final : public IEntropySource {
 public:
  SystemEntropySource() = default;
  ~SystemEntropySource() override = default;

  SystemEntropySource(const SystemEntropySource&) = default;
  SystemEntropySource& operator=(const SystemEntropySource&) = default;
  SystemEntropySource(SystemEntropySource&&) = default;
  SystemEntropySource& operator=(SystemEntropySource&&) = default;

  std::vector<std::uint8_t> bytes(std::size_t count) override;
};

// Deterministic source: cycles through a fixed byte pattern.
// For tests and demos only; identifiers built from it are not collision resistant.
class FixedEntropySource final : public IEntropySource {
 public:
  // Throws std::invalid_argument if pattern is empty.
  explicit FixedEntropySource(std::vector<std::uint8_t> pattern);
  ~FixedEntropySource() override = default;

  FixedEntropySource(const FixedEntropySource&) = default;
  FixedEntropySource& operator=(const FixedEntropySource&) = default;
  FixedEntropySource(FixedEntropySource&&) = default;
  FixedEntropySource& operator=(FixedEntropySource&&) = default;

  // Each call starts again from the beginning of the pattern.
  std::vector<std::uint8_t> bytes(std::size_t count) override;

 private:
  std::vector<std::uint8_t> pattern_;
};

}  // namespace ulidcore::core
