#include "encode_time_logic.h"

#include "ulidcore/codec/time_codec.h"
#include "ulidcore/core/result.h"

#include "shared/numbers.h"

namespace ulidcore::cli {

int execute_encode_time(const std::string& millis, std::ostream& out, std::ostream& err) {
  const auto parsed = apps::parse_int64(millis);
  if (!parsed.has_value()) {
    err << "Error: '" << millis << "' is not an integer millisecond timestamp\n";
    return 1;
  }

  try {
    out << codec::encode_time(*parsed) << "\n";
  } catch (const core::RangeError& e) {
    err << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

}  // namespace ulidcore::cli
