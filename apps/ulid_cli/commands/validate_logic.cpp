#include "validate_logic.h"

#include "ulidcore/codec/validator.h"

#include <nlohmann/json.hpp>

#include <string>

namespace ulidcore::cli {

int execute_validate(const std::string& id, std::ostream& out) {
  const auto format = codec::check_format(id);

  nlohmann::json doc;
  doc["id"] = id;
  doc["valid"] = format.has_value();
  if (!format.has_value()) {
    doc["error"] = std::string{core::format_error_message(format.error())};
  }

  // Input is arbitrary bytes; invalid UTF-8 is echoed as U+FFFD.
  out << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
  return format.has_value() ? 0 : 1;
}

}  // namespace ulidcore::cli
