#include "next_id.h"

#include "common.h"

#include "kira/repair/repair_service.h"
#include "kira/workspace/filesystem_work_item_store.h"

#include <iostream>
#include <vector>

int cmd_next_id(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using kira::cli::CommandConfig;

  const std::vector<kira::apps::Option<CommandConfig>> options = {
      kira::cli::root_option(),
      kira::cli::help_option(),
  };
  const auto parsed = kira::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || parsed.config.help) {
    std::ostream& out = parsed.ok ? std::cout : std::cerr;
    out << "Usage: kira_cli next-id [options]\n";
    kira::apps::write_options_help(out, options);
    return parsed.ok ? 0 : 1;
  }

  const kira::core::SystemClock clock{};
  auto project = kira::cli::open_project(parsed.config, clock);
  if (!project.has_value()) {
    return 1;
  }

  const kira::workspace::FilesystemWorkItemStore store(project->work_root);
  auto id = kira::repair::next_id(store);
  if (!id.has_value()) {
    std::cerr << "Failed to get next ID: " << id.error().message << "\n";
    return 1;
  }
  std::cout << id.value() << "\n";
  return 0;
}
