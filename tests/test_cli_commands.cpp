#include "ulidcore/core/alphabet.h"
#include "ulidcore/core/clock.h"
#include "ulidcore/core/entropy.h"
#include "ulidcore/core/result.h"

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "commands/decode_logic.h"
#include "commands/encode_time_logic.h"
#include "commands/generate.h"
#include "commands/generate_logic.h"
#include "commands/validate_logic.h"
#include <sstream>
#include <string>

using namespace ulidcore;

// ── generate ────────────────────────────────────────────────────────────────

TEST_CASE("validate_generate_config: defaults are valid", "[cli][generate][config]") {
  CHECK(cli::validate_generate_config(cli::GenerateCliConfig{}).empty());
}

TEST_CASE("validate_generate_config: count and timestamp bounds", "[cli][generate][config]") {
  cli::GenerateCliConfig zero_count;
  zero_count.count = 0;
  CHECK_FALSE(cli::validate_generate_config(zero_count).empty());

  cli::GenerateCliConfig huge_count;
  huge_count.count = cli::kMaxGenerateCount + 1;
  CHECK_FALSE(cli::validate_generate_config(huge_count).empty());

  cli::GenerateCliConfig negative_ts;
  negative_ts.timestamp = -1;
  CHECK_FALSE(cli::validate_generate_config(negative_ts).empty());

  cli::GenerateCliConfig max_ts;
  max_ts.timestamp = core::kMaxTimestampMs;
  CHECK(cli::validate_generate_config(max_ts).empty());
}

TEST_CASE("execute_generate: plain output, one identifier per line", "[cli][generate]") {
  core::FixedClock clock(1469918176385);
  core::FixedEntropySource entropy({0xAA});
  cli::GenerateCliConfig config;
  config.count = 2;

  std::ostringstream out;
  CHECK(cli::execute_generate(config, clock, entropy, out) == 0);
  CHECK(out.str() == "01ARYZ6S41NANANANANANANANA\n01ARYZ6S41NANANANANANANANA\n");
}

TEST_CASE("execute_generate: JSON output", "[cli][generate]") {
  core::FixedClock clock(0);
  core::FixedEntropySource entropy({0x00});
  cli::GenerateCliConfig config;
  config.count = 3;
  config.json = true;

  std::ostringstream out;
  REQUIRE(cli::execute_generate(config, clock, entropy, out) == 0);

  const auto doc = nlohmann::json::parse(out.str());
  CHECK(doc["count"] == 3);
  REQUIRE(doc["ids"].size() == 3);
  CHECK(doc["ids"][0] == std::string(core::kUlidLength, '0'));
}

// ── validate ────────────────────────────────────────────────────────────────

TEST_CASE("execute_validate: well-formed identifier exits 0", "[cli][validate]") {
  std::ostringstream out;
  CHECK(cli::execute_validate("01ARYZ6S41TSV4RRFFQ69G5FAV", out) == 0);

  const auto doc = nlohmann::json::parse(out.str());
  CHECK(doc["valid"] == true);
  CHECK_FALSE(doc.contains("error"));
}

TEST_CASE("execute_validate: malformed identifier exits 1 with a reason", "[cli][validate]") {
  std::ostringstream out;
  CHECK(cli::execute_validate("01ARYZ6S41TSV4RRFFQ69G5FAU", out) == 1);

  const auto doc = nlohmann::json::parse(out.str());
  CHECK(doc["valid"] == false);
  CHECK(doc["error"] == std::string{core::format_error_message(core::FormatError::kInvalidSymbol)});
}

TEST_CASE("execute_validate: non-UTF-8 input exits 1 with parseable JSON", "[cli][validate]") {
  const std::string raw(26, '\xFF');
  std::ostringstream out;
  CHECK(cli::execute_validate(raw, out) == 1);

  const auto doc = nlohmann::json::parse(out.str());
  CHECK(doc["valid"] == false);
  CHECK(doc["error"] == std::string{core::format_error_message(core::FormatError::kInvalidSymbol)});
  CHECK(doc["id"].get<std::string>().find("\xEF\xBF\xBD") != std::string::npos);
}

// ── decode ──────────────────────────────────────────────────────────────────

TEST_CASE("execute_decode: prints canonical fields and localized creation time",
          "[cli][decode]") {
  cli::DecodeCliConfig config;
  std::ostringstream out;
  std::ostringstream err;

  REQUIRE(cli::execute_decode("01aryz6s41tsv4rrffq69g5fav", config, out, err) == 0);
  CHECK(err.str().empty());

  const auto doc = nlohmann::json::parse(out.str());
  CHECK(doc["id"] == "01ARYZ6S41TSV4RRFFQ69G5FAV");
  CHECK(doc["time_field"] == "01ARYZ6S41");
  CHECK(doc["random_field"] == "TSV4RRFFQ69G5FAV");
  CHECK(doc["timestamp_ms"] == 1469918176385);
  CHECK(doc["created_at"] == "2016-07-31T06:36:16.385+08:00");
}

TEST_CASE("execute_decode: UTC offset override", "[cli][decode]") {
  cli::DecodeCliConfig config;
  config.utc_offset = std::chrono::minutes{0};
  std::ostringstream out;
  std::ostringstream err;

  REQUIRE(cli::execute_decode("01ARYZ6S41TSV4RRFFQ69G5FAV", config, out, err) == 0);
  CHECK(nlohmann::json::parse(out.str())["created_at"] == "2016-07-30T22:36:16.385Z");
}

TEST_CASE("execute_decode: malformed identifier exits 1", "[cli][decode]") {
  cli::DecodeCliConfig config;
  std::ostringstream out;
  std::ostringstream err;

  CHECK(cli::execute_decode("01ARYZ6S41", config, out, err) == 1);
  CHECK(out.str().empty());
  CHECK_FALSE(err.str().empty());
}

// ── encode-time ─────────────────────────────────────────────────────────────

TEST_CASE("execute_encode_time: prints the 10-symbol time field", "[cli][encode]") {
  std::ostringstream out;
  std::ostringstream err;
  CHECK(cli::execute_encode_time("32", out, err) == 0);
  CHECK(out.str() == "0000000010\n");
}

TEST_CASE("execute_encode_time: range and parse failures exit 1", "[cli][encode]") {
  for (const char* input : {"-1", "281474976710656", "abc", "12x", ""}) {
    std::ostringstream out;
    std::ostringstream err;
    CHECK(cli::execute_encode_time(input, out, err) == 1);
    CHECK(out.str().empty());
    CHECK_FALSE(err.str().empty());
  }
}
