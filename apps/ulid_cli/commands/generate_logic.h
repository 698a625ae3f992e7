#pragma once

#include "ulidcore/core/clock.h"
#include "ulidcore/core/entropy.h"

#include "generate.h"
#include <ostream>

namespace ulidcore::cli {

// execute_generate mints config.count identifiers and prints them to `out`.
// Takes only interface types so tests can pin the clock and entropy.
// Precondition: validate_generate_config(config) is empty.
//
// Plain output: one identifier per line.
// JSON output: {"count": N, "ids": [...]}
int execute_generate(const GenerateCliConfig& config, core::IClock& clock,
                     core::IEntropySource& entropy, std::ostream& out);

}  // namespace ulidcore::cli
