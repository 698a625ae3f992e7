#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ulidcore::core {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

// Fixed offset used for every stored time in the owning backend (UTC+8).
inline constexpr std::chrono::minutes kBeijingOffset{8 * 60};

inline Timestamp now_utc() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return ts.time_since_epoch().count();
}

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp{std::chrono::milliseconds{millis}};
}

// format_timestamp renders ts shifted into a fixed UTC offset using strftime
// syntax. The offset itself is not printed unless fmt asks for it literally.
[[nodiscard]] std::string format_timestamp(Timestamp ts, std::chrono::minutes offset,
                                           std::string_view fmt = "%Y-%m-%d %H:%M:%S");

// format_iso8601 renders ts as "YYYY-MM-DDTHH:MM:SS.mmm+HH:MM" in the given
// offset, or with a trailing "Z" when the offset is zero.
// Both formatters throw std::runtime_error if the platform cannot break ts
// into calendar fields.
[[nodiscard]] std::string format_iso8601(Timestamp ts, std::chrono::minutes offset);

// parse_utc_offset accepts "Z", "+HH:MM", "-HH:MM", "+HHMM", "-HHMM" and "+HH".
// Hours are limited to 0..14 and minutes to 0..59.
// Returns nullopt for anything else.
[[nodiscard]] std::optional<std::chrono::minutes> parse_utc_offset(std::string_view text);

}  // namespace ulidcore::core
