#include "ulidcore/codec/validator.h"
#include "ulidcore/core/id_generator.h"
#include "ulidcore/ulidcore.h"

#include <catch2/catch.hpp>

#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace ulidcore;

namespace {

constexpr std::size_t kTotalIds = 100'000;

}  // namespace

TEST_CASE("generate: 100,000 identifiers in a tight loop are distinct", "[uniqueness]") {
  std::unordered_set<std::string> seen;
  seen.reserve(kTotalIds);

  for (std::size_t i = 0; i < kTotalIds; ++i) {
    seen.insert(ulidcore::generate());
  }

  CHECK(seen.size() == kTotalIds);
}

TEST_CASE("SystemIdGenerator: concurrent generation yields no duplicates",
          "[uniqueness][concurrency]") {
  constexpr std::size_t kThreads = 4;
  constexpr std::size_t kPerThread = kTotalIds / kThreads;

  // One generator shared by every thread: it holds no mutable shared state.
  core::SystemIdGenerator gen;
  std::vector<std::vector<std::string>> batches(kThreads);
  std::vector<std::thread> workers;
  workers.reserve(kThreads);

  for (std::size_t t = 0; t < kThreads; ++t) {
    workers.emplace_back([&gen, &batch = batches[t]]() {
      batch.reserve(kPerThread);
      for (std::size_t i = 0; i < kPerThread; ++i) {
        batch.push_back(gen.next().value);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  std::unordered_set<std::string> seen;
  seen.reserve(kTotalIds);
  for (const auto& batch : batches) {
    for (const auto& id : batch) {
      REQUIRE(codec::is_valid(id));
      seen.insert(id);
    }
  }

  CHECK(seen.size() == kThreads * kPerThread);
}
