#include "doctor.h"

#include "common.h"

#include "kira/repair/repair_service.h"
#include "kira/validation/report_format.h"
#include "kira/validation/validation_engine.h"
#include "kira/workspace/filesystem_work_item_store.h"

#include <cstddef>
#include <iostream>
#include <string_view>
#include <vector>

namespace {

using kira::validation::IssueCategory;
using kira::validation::ValidationReport;

// Prints the applied fixes of one repair pass under `title` and any failures
// under a separate heading. Returns the number of applied fixes.
std::size_t print_repair_report(const std::string_view title, const ValidationReport& report) {
  ValidationReport fixed;
  ValidationReport failed;
  for (const auto& issue : report.issues()) {
    ValidationReport& target = issue.category == IssueCategory::kFixed ? fixed : failed;
    target.add(issue.rule_id, issue.category, issue.file, issue.message);
  }

  if (fixed.has_errors()) {
    std::cout << "\n" << title << ":\n";
    kira::validation::write_issue_lines(fixed, std::cout);
  }
  if (failed.has_errors()) {
    std::cout << "\nCould not apply some fixes:\n";
    kira::validation::write_issue_lines(failed, std::cout);
  }
  return fixed.size();
}

}  // namespace

int cmd_doctor(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  using kira::cli::CommandConfig;

  const std::vector<kira::apps::Option<CommandConfig>> options = {
      kira::cli::root_option(),
      kira::cli::strict_option(),
      kira::cli::help_option(),
  };
  const auto parsed = kira::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || parsed.config.help) {
    std::ostream& out = parsed.ok ? std::cout : std::cerr;
    out << "Usage: kira_cli doctor [options]\n";
    kira::apps::write_options_help(out, options);
    return parsed.ok ? 0 : 1;
  }

  const kira::core::SystemClock clock{};
  auto project = kira::cli::open_project(parsed.config, clock);
  if (!project.has_value()) {
    return 1;
  }

  kira::workspace::FilesystemWorkItemStore store(project->work_root);
  const kira::validation::ValidationEngine engine(project->schema, clock);

  std::cout << "Validating work items...\n";
  auto before = engine.validate(store);
  if (!before.has_value()) {
    std::cerr << "Failed to validate work items: " << before.error().message << "\n";
    return 1;
  }
  if (!before.value().has_errors()) {
    kira::validation::write_report_text(before.value(), std::cout);
    return 0;
  }
  std::cout << "\n";
  kira::validation::write_report_text(before.value(), std::cout);

  std::cout << "Attempting to fix issues...\n";
  std::size_t fixed_count = 0;

  auto duplicates = kira::repair::fix_duplicate_ids(store, project->schema);
  if (!duplicates.has_value()) {
    std::cerr << "Failed to fix duplicate IDs: " << duplicates.error().message << "\n";
    return 1;
  }
  fixed_count += print_repair_report("Fixed duplicate IDs", duplicates.value());

  auto dates = kira::repair::fix_created_dates(store);
  if (!dates.has_value()) {
    std::cerr << "Failed to fix date formats: " << dates.error().message << "\n";
    return 1;
  }
  fixed_count += print_repair_report("Fixed date formats", dates.value());

  auto fields = kira::repair::fix_field_issues(store, project->schema, clock);
  if (!fields.has_value()) {
    std::cerr << "Failed to fix field issues: " << fields.error().message << "\n";
    return 1;
  }
  fixed_count += print_repair_report("Fixed field issues", fields.value());

  auto after = engine.validate(store);
  if (!after.has_value()) {
    std::cerr << "Failed to re-validate work items: " << after.error().message << "\n";
    return 1;
  }

  if (after.value().has_errors()) {
    std::cout << "\nIssues requiring manual attention:\n";
    kira::validation::write_issue_groups(after.value(), std::cout);
    std::cout << "These issues cannot be automatically fixed and need manual intervention.\n";
  } else if (fixed_count > 0) {
    std::cout << "\nAll fixable issues have been resolved!\n";
  } else {
    std::cout << "\nAll issues have been resolved!\n";
  }
  return 0;
}
