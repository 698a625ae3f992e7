#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace ulidcore::apps {

// parse_int64 accepts an optional leading '-' followed by decimal digits and
// nothing else. Out-of-range values and trailing garbage return nullopt.
[[nodiscard]] inline std::optional<std::int64_t> parse_int64(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::int64_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

}  // namespace ulidcore::apps
