#include "ulidcore/core/time.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ulidcore::core {

namespace {

// Split into whole seconds and a 0..999 millisecond remainder (floor semantics,
// so pre-epoch values still format correctly).
std::tm to_shifted_tm(const Timestamp ts, const std::chrono::minutes offset, int& millis_out) {
  const auto shifted = ts + offset;
  const auto secs = std::chrono::floor<std::chrono::seconds>(shifted);
  millis_out = static_cast<int>((shifted - secs).count());

  const std::time_t as_time_t = static_cast<std::time_t>(secs.time_since_epoch().count());
  std::tm tm{};
  // gmtime_r (POSIX): std::gmtime shares a static buffer across threads.
  if (gmtime_r(&as_time_t, &tm) == nullptr) {
    throw std::runtime_error("timestamp cannot be converted to calendar time");
  }
  return tm;
}

bool all_digits(const std::string_view text) {
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return !text.empty();
}

int two_digit_value(const std::string_view text) {
  return (text[0] - '0') * 10 + (text[1] - '0');
}

}  // namespace

std::string format_timestamp(const Timestamp ts, const std::chrono::minutes offset,
                             const std::string_view fmt) {
  int millis = 0;
  const std::tm tm = to_shifted_tm(ts, offset, millis);

  std::ostringstream oss;
  oss << std::put_time(&tm, std::string{fmt}.c_str());
  return oss.str();
}

std::string format_iso8601(const Timestamp ts, const std::chrono::minutes offset) {
  int millis = 0;
  const std::tm tm = to_shifted_tm(ts, offset, millis);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << millis;

  const auto total = offset.count();
  if (total == 0) {
    oss << 'Z';
    return oss.str();
  }

  const auto magnitude = total < 0 ? -total : total;
  oss << (total < 0 ? '-' : '+') << std::setw(2) << (magnitude / 60) << ':' << std::setw(2)
      << (magnitude % 60);
  return oss.str();
}

std::optional<std::chrono::minutes> parse_utc_offset(const std::string_view text) {
  if (text == "Z" || text == "z") {
    return std::chrono::minutes{0};
  }
  if (text.size() < 3) {
    return std::nullopt;
  }

  const char sign = text[0];
  if (sign != '+' && sign != '-') {
    return std::nullopt;
  }

  std::string_view rest = text.substr(1);
  std::string_view hours_view;
  std::string_view minutes_view{"00"};

  if (rest.size() == 2) {
    hours_view = rest;
  } else if (rest.size() == 4) {
    hours_view = rest.substr(0, 2);
    minutes_view = rest.substr(2);
  } else if (rest.size() == 5 && rest[2] == ':') {
    hours_view = rest.substr(0, 2);
    minutes_view = rest.substr(3);
  } else {
    return std::nullopt;
  }

  if (!all_digits(hours_view) || !all_digits(minutes_view)) {
    return std::nullopt;
  }

  const int hours = two_digit_value(hours_view);
  const int minutes = two_digit_value(minutes_view);
  if (hours > 14 || minutes > 59) {
    return std::nullopt;
  }

  const int total = hours * 60 + minutes;
  return std::chrono::minutes{sign == '-' ? -total : total};
}

}  // namespace ulidcore::core
