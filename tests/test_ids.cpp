#include "ulidcore/codec/ulid_codec.h"
#include "ulidcore/codec/validator.h"
#include "ulidcore/core/id_generator.h"
#include "ulidcore/core/ids.h"

#include <catch2/catch.hpp>

#include <sstream>

using namespace ulidcore;

TEST_CASE("ID generators produce well-formed identifiers", "[ids]") {
  SECTION("SystemIdGenerator produces valid identifiers") {
    core::SystemIdGenerator gen;
    const auto id = gen.next();

    REQUIRE(id.value.size() == 26);
    CHECK(codec::is_valid(id.value));
  }

  SECTION("UlidGenerator with fixed clock and entropy is reproducible") {
    core::FixedClock clock(1469918176385);
    core::FixedEntropySource entropy({0xAA});
    core::UlidGenerator gen(clock, entropy);

    const auto first = gen.next();
    const auto second = gen.next();

    CHECK(first.value == "01ARYZ6S41NANANANANANANANA");
    CHECK(first == second);
  }
}

TEST_CASE("UlidGenerator: time field tracks the injected clock", "[ids]") {
  core::FixedClock clock(1700000000000);
  core::SystemEntropySource entropy;
  core::UlidGenerator gen(clock, entropy);

  CHECK(codec::ulid_timestamp(gen.next()) == 1700000000000);
}

TEST_CASE("UlidGenerator: clock outside 48 bits propagates RangeError", "[ids][errors]") {
  core::FixedClock clock(-1);
  core::SystemEntropySource entropy;
  core::UlidGenerator gen(clock, entropy);

  CHECK_THROWS_AS(gen.next(), core::RangeError);
}

TEST_CASE("Ulid: streams its canonical value", "[ids]") {
  std::ostringstream oss;
  oss << core::Ulid{"01ARYZ6S41TSV4RRFFQ69G5FAV"};
  CHECK(oss.str() == "01ARYZ6S41TSV4RRFFQ69G5FAV");
}
