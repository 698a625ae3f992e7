#include "ulidcore/core/clock.h"

#include "ulidcore/core/time.h"

namespace ulidcore::core {

std::int64_t SystemClock::now_unix_millis() {
  return to_unix_millis(now_utc());
}

std::int64_t FixedClock::now_unix_millis() {
  return fixed_millis_;
}

}  // namespace ulidcore::core
