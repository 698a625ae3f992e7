#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ulidcore::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. Handlers
// report their own diagnostics to stderr.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedArgs is the outcome of parse_options.
// error_count counts unknown flags, missing values and rejected values; the
// caller decides whether any error is fatal (all current commands exit 1).
template <typename Config>
struct ParsedArgs {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  int error_count{0};                    // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and collects non-flag tokens as positionals in encounter
// order. A lone "-", a dash followed by a digit ("-1") and every token after
// "--" are positional.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 2,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, 0};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  bool only_positionals = false;
  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const bool flag_like = arg.size() >= 2 && arg[0] == '-' && (arg[1] < '0' || arg[1] > '9');
    if (only_positionals || !flag_like) {
      parsed.positionals.push_back(std::move(arg));
      continue;
    }
    if (arg == "--") {
      only_positionals = true;
      continue;
    }

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      std::cerr << "Unknown option: " << arg << "\n";
      ++parsed.error_count;
      continue;
    }

    const Option<Config>* opt = it->second;
    bool accepted = true;
    if (opt->requires_value) {
      if (i + 1 < argc) {
        accepted = opt->handler(parsed.config,
                                argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      } else {
        std::cerr << "Option " << arg << " requires a value\n";
        accepted = false;
      }
    } else {
      accepted = opt->handler(parsed.config, "");
    }

    if (!accepted) {
      ++parsed.error_count;
    }
  }

  return parsed;
}

// print_usage writes one line per option: "  <name> [value]  <description>".
template <typename Config>
void print_usage(std::ostream& os, const std::string& synopsis,
                 const std::vector<Option<Config>>& options) {
  os << "Usage: " << synopsis << "\n";
  for (const auto& opt : options) {
    os << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "  " << opt.description
       << "\n";
  }
}

}  // namespace ulidcore::apps
