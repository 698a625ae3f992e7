#pragma once

#include <ostream>
#include <string>

namespace ulidcore::cli {

// execute_encode_time parses `millis` and prints encode_time(millis).
// Non-numeric input and RangeError are reported on `err` and return 1.
int execute_encode_time(const std::string& millis, std::ostream& out, std::ostream& err);

}  // namespace ulidcore::cli
