#pragma once

#include <ostream>
#include <string>

namespace ulidcore::core {

// Ulid is the primary-key vocabulary type handed to collaborators.
// `value` always holds the canonical (upper-case) 26-symbol form when built
// through parse_ulid, make_ulid or an IIdGenerator. Ordering is plain string
// ordering, which matches creation order at millisecond granularity.
struct Ulid {
  std::string value;
  auto operator<=>(const Ulid&) const = default;  // C++20: generates ==, !=, <, <=, >, >=
};

inline std::ostream& operator<<(std::ostream& os, const Ulid& id) {
  return os << id.value;
}

}  // namespace ulidcore::core
