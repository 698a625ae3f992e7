#include "ulidcore/codec/random_field.h"

#include "ulidcore/core/alphabet.h"

namespace ulidcore::codec {

namespace {

constexpr unsigned kBitsPerSymbol = 5u;
constexpr unsigned kBitsPerByte = 8u;
constexpr unsigned kSymbolMask = 0x1Fu;

}  // namespace

std::string unpack_symbols(const std::vector<std::uint8_t>& bytes,
                           const std::size_t symbol_count) {
  std::string out;
  out.reserve(symbol_count);

  for (std::size_t i = 0; i < symbol_count; ++i) {
    const std::size_t bit_offset = i * kBitsPerSymbol;
    const std::size_t byte_index = bit_offset / kBitsPerByte;
    const unsigned bit_index = static_cast<unsigned>(bit_offset % kBitsPerByte);

    const unsigned first = byte_index < bytes.size() ? bytes[byte_index] : 0u;
    unsigned value = 0;

    if (bit_index <= kBitsPerByte - kBitsPerSymbol) {
      // Whole group inside one byte.
      value = (first >> (kBitsPerByte - kBitsPerSymbol - bit_index)) & kSymbolMask;
    } else {
      // Group straddles two bytes: low bits of `first` become the high bits.
      const unsigned bits_from_first = kBitsPerByte - bit_index;
      const unsigned bits_from_second = kBitsPerSymbol - bits_from_first;
      value = (first & ((1u << bits_from_first) - 1u)) << bits_from_second;

      if (byte_index + 1 < bytes.size()) {
        value |= static_cast<unsigned>(bytes[byte_index + 1]) >> (kBitsPerByte - bits_from_second);
      }
    }

    out.push_back(core::symbol_for(value));
  }

  return out;
}

std::string generate_random(const std::size_t symbol_count, core::IEntropySource& source) {
  const auto random_bytes = source.bytes(bytes_for_symbols(symbol_count));
  return unpack_symbols(random_bytes, symbol_count);
}

std::string generate_random(const std::size_t symbol_count) {
  core::SystemEntropySource source;
  return generate_random(symbol_count, source);
}

}  // namespace ulidcore::codec
