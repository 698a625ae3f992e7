#pragma once

#include <ostream>
#include <string>

namespace ulidcore::cli {

// execute_validate prints {"id", "valid", and "error" when invalid} and
// returns 0 for a well-formed identifier, 1 otherwise.
int execute_validate(const std::string& id, std::ostream& out);

}  // namespace ulidcore::cli
