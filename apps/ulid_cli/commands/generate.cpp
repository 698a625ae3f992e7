#include "generate.h"

#include "ulidcore/core/alphabet.h"
#include "ulidcore/core/clock.h"
#include "ulidcore/core/entropy.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include "shared/numbers.h"
#include <iostream>
#include <vector>

namespace ulidcore::cli {

std::string validate_generate_config(const GenerateCliConfig& config) {
  if (config.count < 1 || config.count > kMaxGenerateCount) {
    return "--count must be between 1 and " + std::to_string(kMaxGenerateCount);
  }
  if (config.timestamp.has_value() &&
      (*config.timestamp < 0 || *config.timestamp > core::kMaxTimestampMs)) {
    return "--timestamp must be between 0 and " + std::to_string(core::kMaxTimestampMs);
  }
  return "";
}

}  // namespace ulidcore::cli

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using ulidcore::cli::GenerateCliConfig;

  const std::vector<ulidcore::apps::Option<GenerateCliConfig>> options = {
      {"--count", true, "Number of identifiers to mint (default 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto parsed = ulidcore::apps::parse_int64(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --count: " << v << " (expected an integer)\n";
           return false;
         }
         c.count = *parsed;
         return true;
       }},
      {"--timestamp", true, "Mint at this Unix time in milliseconds instead of now",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto parsed = ulidcore::apps::parse_int64(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --timestamp: " << v << " (expected milliseconds)\n";
           return false;
         }
         c.timestamp = *parsed;
         return true;
       }},
      {"--json", false, "Print a JSON document instead of one identifier per line",
       [](GenerateCliConfig& c, const std::string& /*v*/) {
         c.json = true;
         return true;
       }},
  };
  const auto parsed = ulidcore::apps::parse_options(argc, argv, options, 2);
  if (parsed.error_count > 0) {
    ulidcore::apps::print_usage(std::cerr, "ulid_cli generate [options]", options);
    return 1;
  }
  if (!parsed.positionals.empty()) {
    std::cerr << "Error: generate takes no positional arguments (got '" << parsed.positionals[0]
              << "')\n";
    return 1;
  }

  const auto error = ulidcore::cli::validate_generate_config(parsed.config);
  if (!error.empty()) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  ulidcore::core::SystemEntropySource entropy;
  if (parsed.config.timestamp.has_value()) {
    ulidcore::core::FixedClock clock(*parsed.config.timestamp);
    return ulidcore::cli::execute_generate(parsed.config, clock, entropy, std::cout);
  }
  ulidcore::core::SystemClock clock;
  return ulidcore::cli::execute_generate(parsed.config, clock, entropy, std::cout);
}
