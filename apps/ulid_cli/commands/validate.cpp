#include "validate.h"

#include "shared/arg_parser.h"
#include "validate_logic.h"
#include <iostream>
#include <vector>

namespace {

struct ValidateCliConfig {};

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<ulidcore::apps::Option<ValidateCliConfig>> options;
  const auto parsed = ulidcore::apps::parse_options(argc, argv, options, 2);

  if (parsed.error_count > 0 || parsed.positionals.size() != 1) {
    std::cerr << "Usage: ulid_cli validate <id>\n";
    return 1;
  }

  return ulidcore::cli::execute_validate(parsed.positionals[0], std::cout);
}
