#pragma once

#include "kira/core/clock.h"
#include "kira/workspace/project.h"

#include "shared/arg_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace kira::cli {

enum class OutputFormat {
  kText,
  kJson,
};

// Flags shared by the subcommands. Each command picks the options it accepts.
struct CommandConfig {
  std::string root{"."};
  bool strict{false};
  OutputFormat format{OutputFormat::kText};
  bool help{false};
};

[[nodiscard]] apps::Option<CommandConfig> root_option();
[[nodiscard]] apps::Option<CommandConfig> strict_option();
[[nodiscard]] apps::Option<CommandConfig> format_option();
[[nodiscard]] apps::Option<CommandConfig> help_option();

// Loads kira.yml for config.root and checks that the work folder exists.
// Problems are reported on stderr; nullopt means the command should exit 1.
// --strict is applied to the loaded schema.
[[nodiscard]] std::optional<workspace::Project> open_project(const CommandConfig& config,
                                                             const core::IClock& clock);

}  // namespace kira::cli
