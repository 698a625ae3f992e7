#include "decode.h"

#include "decode_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

int cmd_decode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using ulidcore::cli::DecodeCliConfig;

  const std::vector<ulidcore::apps::Option<DecodeCliConfig>> options = {
      {"--utc-offset", true, "Offset for created_at: Z, +HH:MM, -HH:MM (default +08:00)",
       [](DecodeCliConfig& c, const std::string& v) {
         const auto offset = ulidcore::core::parse_utc_offset(v);
         if (!offset.has_value()) {
           std::cerr << "Invalid --utc-offset: " << v << " (valid: Z, +HH:MM, -HH:MM)\n";
           return false;
         }
         c.utc_offset = *offset;
         return true;
       }},
  };
  const auto parsed = ulidcore::apps::parse_options(argc, argv, options, 2);

  if (parsed.error_count > 0 || parsed.positionals.size() != 1) {
    ulidcore::apps::print_usage(std::cerr, "ulid_cli decode <id> [options]", options);
    return 1;
  }

  return ulidcore::cli::execute_decode(parsed.positionals[0], parsed.config, std::cout,
                                       std::cerr);
}
