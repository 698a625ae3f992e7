#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ulidcore::cli {

// Upper bound for --count; keeps a typo from flooding the terminal.
inline constexpr std::int64_t kMaxGenerateCount = 1'000'000;

struct GenerateCliConfig {
  std::int64_t count{1};                  // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> timestamp;  // NOLINT(readability-identifier-naming)
  bool json{false};                       // NOLINT(readability-identifier-naming)
};

// validate_generate_config returns "" on success, otherwise the first problem:
// - count must be in [1, kMaxGenerateCount]
// - timestamp, when present, must fit the 48-bit time field
[[nodiscard]] std::string validate_generate_config(const GenerateCliConfig& config);

}  // namespace ulidcore::cli

// cmd_generate: ulid_cli generate [--count N] [--timestamp MS] [--json]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
