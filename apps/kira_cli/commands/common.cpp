#include "common.h"

#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace kira::cli {

apps::Option<CommandConfig> root_option() {
  return {"--root", true, "dir", "Project root containing kira.yml (default: .)",
          [](CommandConfig& c, const std::string& v) {
            if (v.empty()) {
              std::cerr << "Invalid --root: must not be empty\n";
              return false;
            }
            c.root = v;
            return true;
          }};
}

apps::Option<CommandConfig> strict_option() {
  return {"--strict", false, "", "Flag fields not defined in configuration",
          [](CommandConfig& c, const std::string& /*v*/) {
            c.strict = true;
            return true;
          }};
}

apps::Option<CommandConfig> format_option() {
  return {"--format", true, "text|json", "Report format (default: text)",
          [](CommandConfig& c, const std::string& v) {
            if (v == "text") {
              c.format = OutputFormat::kText;
              return true;
            }
            if (v == "json") {
              c.format = OutputFormat::kJson;
              return true;
            }
            std::cerr << "Invalid --format: " << v << " (valid: text, json)\n";
            return false;
          }};
}

apps::Option<CommandConfig> help_option() {
  return {"--help", false, "", "Show this help",
          [](CommandConfig& c, const std::string& /*v*/) {
            c.help = true;
            return true;
          }};
}

std::optional<workspace::Project> open_project(const CommandConfig& config,
                                               const core::IClock& clock) {
  auto project = workspace::load_project(config.root, clock);
  if (!project.has_value()) {
    std::cerr << "Failed to load config: " << project.error().message << "\n";
    return std::nullopt;
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(project.value().work_root, ec)) {
    std::cerr << "Not a kira workspace (no " << project.value().schema.work_folder
              << " directory found in " << config.root << ")\n";
    return std::nullopt;
  }

  if (config.strict) {
    project.value().schema.validation.strict = true;
  }
  return std::move(project.value());
}

}  // namespace kira::cli
