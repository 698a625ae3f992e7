#pragma once

#include "decode.h"
#include <ostream>
#include <string>

namespace ulidcore::cli {

// execute_decode prints the fields of a well-formed identifier as JSON:
// id (canonical), time_field, random_field, timestamp_ms, created_at.
// A malformed identifier is reported on `err` and returns 1.
int execute_decode(const std::string& id, const DecodeCliConfig& config, std::ostream& out,
                   std::ostream& err);

}  // namespace ulidcore::cli
