#pragma once

namespace ulidcore::core {

// kBuildVersion is the current software version string.
// Updated once per release.
constexpr const char* kBuildVersion = "1.0";

}  // namespace ulidcore::core
