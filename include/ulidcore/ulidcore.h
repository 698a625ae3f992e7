#pragma once

#include "ulidcore/core/result.h"

#include <cstdint>
#include <string>
#include <string_view>

// Collaborator-facing surface of the identifier codec.
// Everything here is stateless and safe to call from any thread.
namespace ulidcore {

// Mint a new 26-symbol identifier from the wall clock and system entropy.
[[nodiscard]] std::string generate();

// Structural check (length + alphabet, case-insensitive). Never throws.
[[nodiscard]] bool validate(std::string_view text) noexcept;

// Creation time of a well-formed identifier, in Unix epoch milliseconds (UTC).
[[nodiscard]] core::Result<std::int64_t, core::FormatError> decode_timestamp(
    std::string_view text);

// 10-symbol time field for `timestamp_ms`. Throws core::RangeError outside
// [0, 2^48 - 1].
[[nodiscard]] std::string encode_timestamp(std::int64_t timestamp_ms);

}  // namespace ulidcore
