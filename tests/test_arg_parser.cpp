#include <catch2/catch.hpp>

#include "shared/arg_parser.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

using ulidcore::apps::Option;
using ulidcore::apps::parse_options;

namespace {

struct DemoConfig {
  std::optional<std::string> name;
  bool verbose{false};
};

std::vector<Option<DemoConfig>> demo_options() {
  return {
      {"--name", true, "A name",
       [](DemoConfig& c, const std::string& v) {
         if (v.empty()) {
           return false;
         }
         c.name = v;
         return true;
       }},
      {"--verbose", false, "Chatty output",
       [](DemoConfig& c, const std::string& /*v*/) {
         c.verbose = true;
         return true;
       }},
  };
}

// Owns the strings so argv pointers stay valid for the duration of a test.
struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& s : storage) {
      pointers.push_back(s.data());
    }
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }

  std::vector<std::string> storage;
  std::vector<char*> pointers;
};

}  // namespace

TEST_CASE("parse_options: flags and positionals in any order", "[cli][args]") {
  Argv args({"ulid_cli", "decode", "first", "--name", "alice", "--verbose", "second"});
  const auto parsed = parse_options(args.argc(), args.argv(), demo_options());

  CHECK(parsed.error_count == 0);
  CHECK(parsed.config.name == "alice");
  CHECK(parsed.config.verbose);
  CHECK(parsed.positionals == std::vector<std::string>{"first", "second"});
}

TEST_CASE("parse_options: negative numbers and tokens after -- are positional",
          "[cli][args]") {
  Argv args({"ulid_cli", "encode-time", "-1", "--", "--verbose"});
  const auto parsed = parse_options(args.argc(), args.argv(), demo_options());

  CHECK(parsed.error_count == 0);
  CHECK_FALSE(parsed.config.verbose);
  CHECK(parsed.positionals == std::vector<std::string>{"-1", "--verbose"});
}

TEST_CASE("parse_options: unknown flags, missing values and rejected values are counted",
          "[cli][args]") {
  SECTION("unknown flag") {
    Argv args({"ulid_cli", "generate", "--bogus"});
    CHECK(parse_options(args.argc(), args.argv(), demo_options()).error_count == 1);
  }

  SECTION("missing value") {
    Argv args({"ulid_cli", "generate", "--name"});
    const auto parsed = parse_options(args.argc(), args.argv(), demo_options());
    CHECK(parsed.error_count == 1);
    CHECK_FALSE(parsed.config.name.has_value());
  }

  SECTION("handler rejects value") {
    Argv args({"ulid_cli", "generate", "--name", ""});
    CHECK(parse_options(args.argc(), args.argv(), demo_options()).error_count == 1);
  }
}
