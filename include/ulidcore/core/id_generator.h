#pragma once

#include "ulidcore/core/clock.h"
#include "ulidcore/core/entropy.h"
#include "ulidcore/core/ids.h"

namespace ulidcore::core {

// Abstract ID generator interface for dependency injection.
// Collaborators that create records take an IIdGenerator& and call next()
// exactly once per record.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Contract: returned Ulid is canonical, 26 symbols, and its time field is
  // the generator's current clock reading.
  virtual Ulid next() = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// UlidGenerator: clock reading + fresh random field per call.
// Holds references only (no ownership, no counters); thread-safe whenever the
// injected clock and entropy source are. Identifiers minted in the same
// millisecond are not ordered relative to each other.
class UlidGenerator final : public IIdGenerator {
 public:
  UlidGenerator(IClock& clock, IEntropySource& entropy) : clock_(clock), entropy_(entropy) {}
  ~UlidGenerator() override = default;

  // Non-copyable: holds references to injected services.
  UlidGenerator(const UlidGenerator&) = delete;
  UlidGenerator& operator=(const UlidGenerator&) = delete;
  UlidGenerator(UlidGenerator&&) = delete;
  UlidGenerator& operator=(UlidGenerator&&) = delete;

  // Throws RangeError if the clock reads outside the 48-bit range.
  Ulid next() override;

 private:
  IClock& clock_;
  IEntropySource& entropy_;
};

// SystemIdGenerator: UlidGenerator over the wall clock and system entropy.
// The default for production composition roots.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;
  ~SystemIdGenerator() override = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  Ulid next() override;

 private:
  SystemClock clock_;
  SystemEntropySource entropy_;
};

}  // namespace ulidcore::core
