#pragma once

#include "ulidcore/core/result.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace ulidcore::codec {

// is_valid reports whether `text` is structurally a 26-symbol identifier:
// exact length, and every character (case-insensitive) in the alphabet.
// Never throws. Callers must check externally supplied identifiers with this
// before using them as storage lookup keys.
[[nodiscard]] bool is_valid(std::string_view text) noexcept;

// check_format is is_valid with the reason for rejection.
// Length is checked before symbols.
[[nodiscard]] core::Result<bool, core::FormatError> check_format(std::string_view text);

// get_timestamp validates `text` and decodes its first 10 symbols.
// Returns FormatError when `text` is not a well-formed identifier.
[[nodiscard]] core::Result<std::int64_t, core::FormatError> get_timestamp(std::string_view text);

// to_canonical upper-cases ASCII letters. The input is not validated.
[[nodiscard]] std::string to_canonical(std::string_view text);

}  // namespace ulidcore::codec
