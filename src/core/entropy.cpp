#include "ulidcore/core/entropy.h"

#include <random>
#include <stdexcept>
#include <utility>

namespace ulidcore::core {

std::vector<std::uint8_t> SystemEntropySource::bytes(const std::size_t count) {
  // Per-thread device: no lock contention and no state shared between callers.
  static thread_local std::random_device device;

  std::vector<std::uint8_t> out;
  out.reserve(count);

  while (out.size() < count) {
    // random_device yields 32 bits per draw; slice it into bytes.
    const std::uint32_t word = device();
    for (unsigned shift = 0; shift < 32u && out.size() < count; shift += 8u) {
      out.push_back(static_cast<std::uint8_t>((word >> shift) & 0xFFu));
    }
  }

  return out;
}

FixedEntropySource::FixedEntropySource(std::vector<std::uint8_t> pattern)
    : pattern_(std::move(pattern)) {
  if (pattern_.empty()) {
    throw std::invalid_argument("FixedEntropySource: pattern must not be empty");
  }
}

std::vector<std::uint8_t> FixedEntropySource::bytes(const std::size_t count) {
  std::vector<std::uint8_t> out;
  out.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(pattern_[i % pattern_.size()]);
  }
  return out;
}

}  // namespace ulidcore::core
