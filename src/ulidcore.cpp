#include "ulidcore/ulidcore.h"

#include "ulidcore/codec/time_codec.h"
#include "ulidcore/codec/ulid_codec.h"
#include "ulidcore/codec/validator.h"
#include "ulidcore/core/clock.h"
#include "ulidcore/core/entropy.h"

namespace ulidcore {

std::string generate() {
  core::SystemClock clock;
  core::SystemEntropySource entropy;
  return codec::make_ulid(clock.now_unix_millis(), entropy).value;
}

bool validate(const std::string_view text) noexcept {
  return codec::is_valid(text);
}

core::Result<std::int64_t, core::FormatError> decode_timestamp(const std::string_view text) {
  return codec::get_timestamp(text);
}

std::string encode_timestamp(const std::int64_t timestamp_ms) {
  return codec::encode_time(timestamp_ms);
}

}  // namespace ulidcore
