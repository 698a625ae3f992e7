#include "ulidcore/codec/time_codec.h"

#include "ulidcore/core/alphabet.h"

namespace ulidcore::codec {

std::string encode_time(std::int64_t timestamp_ms) {
  if (timestamp_ms < 0 || timestamp_ms > core::kMaxTimestampMs) {
    throw core::RangeError("encode_time: timestamp " + std::to_string(timestamp_ms) +
                           " ms is outside the 48-bit range [0, " +
                           std::to_string(core::kMaxTimestampMs) + "]");
  }

  // Filled from the right: the last slot receives the least significant digit.
  std::string encoded(core::kTimeFieldLength, core::kAlphabet[0]);
  for (std::size_t i = core::kTimeFieldLength; i > 0; --i) {
    encoded[i - 1] = core::symbol_for(static_cast<unsigned>(timestamp_ms % core::kRadix));
    timestamp_ms /= core::kRadix;
  }
  return encoded;
}

core::Result<std::int64_t, core::FormatError> decode_time(const std::string_view field) {
  using ResultT = core::Result<std::int64_t, core::FormatError>;

  if (field.size() != core::kTimeFieldLength) {
    return ResultT::err(core::FormatError::kInvalidLength);
  }

  std::int64_t value = 0;
  for (const char ch : field) {
    const int digit = core::symbol_value(ch);
    if (digit < 0) {
      return ResultT::err(core::FormatError::kInvalidSymbol);
    }
    value = value * core::kRadix + digit;
  }
  return ResultT::ok(value);
}

}  // namespace ulidcore::codec
