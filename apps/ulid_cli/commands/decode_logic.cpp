#include "decode_logic.h"

#include "ulidcore/codec/ulid_codec.h"

#include <nlohmann/json.hpp>

namespace ulidcore::cli {

int execute_decode(const std::string& id, const DecodeCliConfig& config, std::ostream& out,
                   std::ostream& err) {
  const auto parsed = codec::parse_ulid(id);
  if (!parsed.has_value()) {
    err << "Error: invalid identifier '" << id
        << "': " << core::format_error_message(parsed.error()) << "\n";
    return 1;
  }

  const core::Ulid& ulid = parsed.value();

  nlohmann::json doc;
  doc["id"] = ulid.value;
  doc["time_field"] = std::string{codec::time_field(ulid)};
  doc["random_field"] = std::string{codec::random_field(ulid)};
  doc["timestamp_ms"] = codec::ulid_timestamp(ulid);
  doc["created_at"] = core::format_iso8601(codec::ulid_created_at(ulid), config.utc_offset);

  out << doc.dump(2) << "\n";
  return 0;
}

}  // namespace ulidcore::cli
