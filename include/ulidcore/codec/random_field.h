#pragma once

#include "ulidcore/core/entropy.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ulidcore::codec {

// bytes_for_symbols returns ceil(symbol_count * 5 / 8): the number of random
// bytes needed to fill symbol_count 5-bit groups.
[[nodiscard]] constexpr std::size_t bytes_for_symbols(const std::size_t symbol_count) noexcept {
  return (symbol_count * 5 + 7) / 8;
}

// unpack_symbols reads symbol_count 5-bit groups from a big-endian bitstream
// and maps each onto the alphabet. Group i starts at bit offset i * 5.
//
// A group that lies inside one byte is extracted by shift-and-mask; a group
// that straddles two bytes takes the low bits of the first byte and the high
// bits of the next. Bits past the end of `bytes` read as zero.
[[nodiscard]] std::string unpack_symbols(const std::vector<std::uint8_t>& bytes,
                                         std::size_t symbol_count);

// generate_random draws bytes_for_symbols(symbol_count) bytes from `source`
// and unpacks them. Entropy failures thrown by the source propagate.
[[nodiscard]] std::string generate_random(std::size_t symbol_count,
                                          core::IEntropySource& source);

// Same, using this thread's system entropy source.
[[nodiscard]] std::string generate_random(std::size_t symbol_count);

}  // namespace ulidcore::codec
