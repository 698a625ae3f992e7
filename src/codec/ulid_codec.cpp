#include "ulidcore/codec/ulid_codec.h"

#include "ulidcore/codec/random_field.h"
#include "ulidcore/codec/time_codec.h"
#include "ulidcore/codec/validator.h"
#include "ulidcore/core/alphabet.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace ulidcore::codec {

core::Ulid make_ulid(const std::int64_t timestamp_ms, core::IEntropySource& entropy) {
  std::string value = encode_time(timestamp_ms);
  value += generate_random(core::kRandomFieldLength, entropy);
  return core::Ulid{std::move(value)};
}

core::Result<core::Ulid, core::FormatError> parse_ulid(const std::string_view text) {
  using ResultT = core::Result<core::Ulid, core::FormatError>;

  const auto format = check_format(text);
  if (!format.has_value()) {
    return ResultT::err(format.error());
  }
  return ResultT::ok(core::Ulid{to_canonical(text)});
}

std::string_view time_field(const core::Ulid& id) {
  return std::string_view{id.value}.substr(0, core::kTimeFieldLength);
}

std::string_view random_field(const core::Ulid& id) {
  return std::string_view{id.value}.substr(core::kTimeFieldLength);
}

std::int64_t ulid_timestamp(const core::Ulid& id) {
  const auto decoded = get_timestamp(id.value);
  if (!decoded.has_value()) {
    // Only reachable for a hand-built Ulid that bypassed parse_ulid.
    throw std::invalid_argument("ulid_timestamp: '" + id.value +
                                "': " + std::string{format_error_message(decoded.error())});
  }
  return decoded.value();
}

core::Timestamp ulid_created_at(const core::Ulid& id) {
  return core::from_unix_millis(ulid_timestamp(id));
}

}  // namespace ulidcore::codec
