#include "ulidcore/core/version.h"

#include "commands/decode.h"
#include "commands/encode_time.h"
#include "commands/generate.h"
#include "commands/validate.h"
#include <exception>
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "ulid_cli v" << ulidcore::core::kBuildVersion << "\n"
            << "Usage: ulid_cli <command> [options]\n"
            << "Commands:\n"
            << "  generate [--count N] [--timestamp MS] [--json]  Mint identifiers\n"
            << "  validate <id>                                   Check identifier format\n"
            << "  decode <id> [--utc-offset OFFSET]               Show identifier fields\n"
            << "  encode-time <ms>                                Encode a time field\n"
            << "  version                                         Print version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string command = argv[1];
  try {
    if (command == "generate") {
      return cmd_generate(argc, argv);
    }
    if (command == "validate") {
      return cmd_validate(argc, argv);
    }
    if (command == "decode") {
      return cmd_decode(argc, argv);
    }
    if (command == "encode-time") {
      return cmd_encode_time(argc, argv);
    }
    if (command == "version") {
      std::cout << ulidcore::core::kBuildVersion << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    // Entropy-source failures and clock corruption end up here.
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }

  std::cerr << "Unknown command: " << command << "\n";
  print_usage();
  return 1;
}
