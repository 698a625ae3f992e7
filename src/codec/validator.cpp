#include "ulidcore/codec/validator.h"

#include "ulidcore/codec/time_codec.h"
#include "ulidcore/core/alphabet.h"

namespace ulidcore::codec {

bool is_valid(const std::string_view text) noexcept {
  if (text.size() != core::kUlidLength) {
    return false;
  }
  for (const char ch : text) {
    if (!core::is_symbol(ch)) {
      return false;
    }
  }
  return true;
}

core::Result<bool, core::FormatError> check_format(const std::string_view text) {
  using ResultT = core::Result<bool, core::FormatError>;

  if (text.size() != core::kUlidLength) {
    return ResultT::err(core::FormatError::kInvalidLength);
  }
  for (const char ch : text) {
    if (!core::is_symbol(ch)) {
      return ResultT::err(core::FormatError::kInvalidSymbol);
    }
  }
  return ResultT::ok(true);
}

core::Result<std::int64_t, core::FormatError> get_timestamp(const std::string_view text) {
  const auto format = check_format(text);
  if (!format.has_value()) {
    return core::Result<std::int64_t, core::FormatError>::err(format.error());
  }
  return decode_time(text.substr(0, core::kTimeFieldLength));
}

std::string to_canonical(const std::string_view text) {
  std::string result;
  result.reserve(text.size());

  for (const char ch : text) {
    if (ch >= 'a' && ch <= 'z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch - kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }
  return result;
}

}  // namespace ulidcore::codec
