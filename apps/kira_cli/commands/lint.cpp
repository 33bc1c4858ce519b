#include "lint.h"

#include "common.h"

#include "kira/validation/report_format.h"
#include "kira/validation/validation_engine.h"
#include "kira/workspace/filesystem_work_item_store.h"

#include <iostream>
#include <vector>

int cmd_lint(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using kira::cli::CommandConfig;

  const std::vector<kira::apps::Option<CommandConfig>> options = {
      kira::cli::root_option(),
      kira::cli::strict_option(),
      kira::cli::format_option(),
      kira::cli::help_option(),
  };
  const auto parsed = kira::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || parsed.config.help) {
    std::ostream& out = parsed.ok ? std::cout : std::cerr;
    out << "Usage: kira_cli lint [options]\n";
    kira::apps::write_options_help(out, options);
    return parsed.ok ? 0 : 1;
  }
  const CommandConfig& config = parsed.config;

  const kira::core::SystemClock clock{};
  auto project = kira::cli::open_project(config, clock);
  if (!project.has_value()) {
    return 1;
  }

  const kira::workspace::FilesystemWorkItemStore store(project->work_root);
  const kira::validation::ValidationEngine engine(project->schema, clock);
  auto report = engine.validate(store);
  if (!report.has_value()) {
    std::cerr << "Failed to validate work items: " << report.error().message << "\n";
    return 1;
  }

  if (config.format == kira::cli::OutputFormat::kJson) {
    std::cout << kira::validation::report_to_json(report.value()).dump(2) << "\n";
  } else {
    kira::validation::write_report_text(report.value(), std::cout);
  }
  return report.value().has_errors() ? 1 : 0;
}
