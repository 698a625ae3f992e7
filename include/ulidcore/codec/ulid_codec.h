#pragma once

#include "ulidcore/core/entropy.h"
#include "ulidcore/core/ids.h"
#include "ulidcore/core/result.h"
#include "ulidcore/core/time.h"

#include <cstdint>
#include <string_view>

namespace ulidcore::codec {

// make_ulid composes encode_time(timestamp_ms) with a fresh 16-symbol random
// field drawn from `entropy`.
// Throws core::RangeError for timestamps outside the 48-bit range.
[[nodiscard]] core::Ulid make_ulid(std::int64_t timestamp_ms, core::IEntropySource& entropy);

// parse_ulid accepts any-case input and returns the canonical upper-case form.
[[nodiscard]] core::Result<core::Ulid, core::FormatError> parse_ulid(std::string_view text);

// Field accessors. Precondition: `id` came from parse_ulid/make_ulid.
[[nodiscard]] std::string_view time_field(const core::Ulid& id);
[[nodiscard]] std::string_view random_field(const core::Ulid& id);

[[nodiscard]] std::int64_t ulid_timestamp(const core::Ulid& id);

// Creation instant as a UTC time point. Localizing it (e.g. to
// core::kBeijingOffset) is the caller's job; see core::format_iso8601.
[[nodiscard]] core::Timestamp ulid_created_at(const core::Ulid& id);

}  // namespace ulidcore::codec
