#include "ulidcore/core/id_generator.h"

#include "ulidcore/codec/ulid_codec.h"

namespace ulidcore::core {

Ulid UlidGenerator::next() {
  return codec::make_ulid(clock_.now_unix_millis(), entropy_);
}

Ulid SystemIdGenerator::next() {
  return codec::make_ulid(clock_.now_unix_millis(), entropy_);
}

}  // namespace ulidcore::core
