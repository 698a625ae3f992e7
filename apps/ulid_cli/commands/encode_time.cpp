#include "encode_time.h"

#include "encode_time_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <vector>

namespace {

struct EncodeTimeCliConfig {};

}  // namespace

int cmd_encode_time(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<ulidcore::apps::Option<EncodeTimeCliConfig>> options;
  const auto parsed = ulidcore::apps::parse_options(argc, argv, options, 2);

  if (parsed.error_count > 0 || parsed.positionals.size() != 1) {
    std::cerr << "Usage: ulid_cli encode-time <milliseconds>\n";
    return 1;
  }

  return ulidcore::cli::execute_encode_time(parsed.positionals[0], std::cout, std::cerr);
}
