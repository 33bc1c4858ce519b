#pragma once

#include <cstddef>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kira::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. Handlers
// report their own problems; the parser keeps going either way so every bad
// flag is reported in one run.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string value_name;      // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedOptions is the populated config plus whether every flag was accepted.
template <typename Config>
struct ParsedOptions {
  Config config;  // NOLINT(readability-identifier-naming)
  bool ok{true};  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised
// flag to its handler. Values are taken from the next token or from the
// "--name=value" form. Unknown flags, stray positional tokens and missing
// values are reported to stderr and clear `ok`.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    std::string inline_value;
    bool has_inline_value = false;
    if (const auto eq = arg.find('='); arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      inline_value = arg.substr(eq + 1);
      arg.resize(eq);
      has_inline_value = true;
    }

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        std::cerr << "Unknown option: " << arg << "\n";
      } else {
        std::cerr << "Unexpected argument: " << arg << "\n";
      }
      parsed.ok = false;
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      if (has_inline_value) {
        std::cerr << "Option " << arg << " does not take a value\n";
        parsed.ok = false;
        continue;
      }
      parsed.ok = opt->handler(parsed.config, "") && parsed.ok;
      continue;
    }

    if (has_inline_value) {
      parsed.ok = opt->handler(parsed.config, inline_value) && parsed.ok;
    } else if (i + 1 < argc) {
      const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      parsed.ok = opt->handler(parsed.config, value) && parsed.ok;
    } else {
      std::cerr << "Option " << arg << " requires a value\n";
      parsed.ok = false;
    }
  }

  return parsed;
}

// write_options_help prints one aligned line per option, as used in usage text.
template <typename Config>
void write_options_help(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    std::string flag = opt.name;
    if (opt.requires_value) {
      flag += " <" + opt.value_name + ">";
    }
    out << "  " << flag;
    constexpr std::size_t kColumn = 22;
    out << std::string(flag.size() < kColumn ? kColumn - flag.size() : 1, ' ') << opt.description
        << "\n";
  }
}

}  // namespace kira::apps
