#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ulidcore::core {

// Crockford Base32 alphabet. I, L, O and U are excluded so identifiers survive
// human transcription. Symbol order is value order: '0' == 0 ... 'Z' == 31.
inline constexpr std::string_view kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
inline constexpr std::int64_t kRadix = 32;

// Identifier layout: 10 time symbols followed by 16 random symbols.
inline constexpr std::size_t kTimeFieldLength = 10;
inline constexpr std::size_t kRandomFieldLength = 16;
inline constexpr std::size_t kUlidLength = kTimeFieldLength + kRandomFieldLength;

// Largest timestamp that fits the 48-bit time field (~ year 10895).
inline constexpr std::int64_t kMaxTimestampMs = (std::int64_t{1} << 48) - 1;

namespace detail {

constexpr std::array<std::int8_t, 128> build_decode_table() {
  std::array<std::int8_t, 128> table{};
  for (auto& entry : table) {
    entry = -1;
  }
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    const char upper = kAlphabet[i];
    table[static_cast<std::size_t>(upper)] = static_cast<std::int8_t>(i);
    if (upper >= 'A' && upper <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      table[static_cast<std::size_t>(upper + kCaseOffset)] = static_cast<std::int8_t>(i);
    }
  }
  return table;
}

// ASCII -> symbol value; -1 for characters outside the alphabet.
// Lower-case letters map to the same value as their upper-case form.
inline constexpr std::array<std::int8_t, 128> kDecodeTable = build_decode_table();

}  // namespace detail

// symbol_value returns the 0..31 value of ch, or -1 if ch is not an alphabet
// symbol in either case. Locale-independent.
constexpr int symbol_value(const char ch) noexcept {
  const auto code = static_cast<unsigned char>(ch);
  if (code >= detail::kDecodeTable.size()) {
    return -1;
  }
  return detail::kDecodeTable[code];
}

constexpr bool is_symbol(const char ch) noexcept {
  return symbol_value(ch) >= 0;
}

// Precondition: value < 32.
constexpr char symbol_for(const unsigned value) noexcept {
  return kAlphabet[value & 0x1Fu];
}

}  // namespace ulidcore::core
