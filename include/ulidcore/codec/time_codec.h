#pragma once

#include "ulidcore/core/result.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace ulidcore::codec {

// encode_time maps a millisecond Unix timestamp onto the 10-symbol time field.
//
// Digits are produced least-significant first by repeated division by 32 and
// prepended, for exactly 10 iterations, so the output is always left-padded
// with '0'. For t1 < t2 in range, encode_time(t1) < encode_time(t2) under
// plain string comparison.
//
// Throws core::RangeError unless 0 <= timestamp_ms <= 2^48 - 1.
[[nodiscard]] std::string encode_time(std::int64_t timestamp_ms);

// decode_time reverses encode_time: value = value * 32 + digit, left to right.
// Case-insensitive. Input must be exactly 10 symbols.
//
// Errors: kInvalidLength, kInvalidSymbol.
// No upper bound is enforced beyond what 10 symbols can carry (2^50 - 1);
// structural validation is the only gate.
[[nodiscard]] core::Result<std::int64_t, core::FormatError> decode_time(std::string_view field);

}  // namespace ulidcore::codec
