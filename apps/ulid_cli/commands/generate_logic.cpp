#include "generate_logic.h"

#include "ulidcore/core/id_generator.h"

#include <nlohmann/json.hpp>

namespace ulidcore::cli {

int execute_generate(const GenerateCliConfig& config, core::IClock& clock,
                     core::IEntropySource& entropy, std::ostream& out) {
  core::UlidGenerator generator(clock, entropy);

  if (!config.json) {
    for (std::int64_t i = 0; i < config.count; ++i) {
      out << generator.next().value << "\n";
    }
    return 0;
  }

  nlohmann::json doc;
  doc["count"] = config.count;
  doc["ids"] = nlohmann::json::array();
  for (std::int64_t i = 0; i < config.count; ++i) {
    doc["ids"].push_back(generator.next().value);
  }
  out << doc.dump(2) << "\n";
  return 0;
}

}  // namespace ulidcore::cli
