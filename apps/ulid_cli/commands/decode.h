#pragma once

#include "ulidcore/core/time.h"

#include <chrono>

namespace ulidcore::cli {

struct DecodeCliConfig {
  // Offset used for the human-readable "created_at" field only; timestamp_ms
  // is always the UTC epoch value.
  std::chrono::minutes utc_offset{core::kBeijingOffset};  // NOLINT(readability-identifier-naming)
};

}  // namespace ulidcore::cli

// cmd_decode: ulid_cli decode <id> [--utc-offset +08:00]
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
