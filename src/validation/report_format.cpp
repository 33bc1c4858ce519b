#include "kira/validation/report_format.h"

#include <array>
#include <string>
#include <utility>

namespace kira::validation {

namespace {

constexpr std::string_view kNoIssuesMessage = "No issues found. All work items are valid.";

struct Section {
  std::string_view title;
  bool include_file;
};

constexpr std::array<Section, 6> kSections = {{
    {"Field Validation Errors", true},
    {"Unknown Fields", true},
    {"Workflow Errors", false},
    {"Duplicate ID Errors", true},
    {"Parse Errors", true},
    {"Other Errors", true},
}};

std::size_t section_index(const IssueCategory category) {
  switch (category) {
    case IssueCategory::kField:
      return 0;
    case IssueCategory::kUnknownField:
      return 1;
    case IssueCategory::kWorkflow:
      return 2;
    case IssueCategory::kDuplicate:
      return 3;
    case IssueCategory::kParse:
      return 4;
    default:
      return 5;
  }
}

}  // namespace

std::vector<IssueGroup> group_issues(const ValidationReport& report) {
  std::array<IssueGroup, kSections.size()> buckets;
  for (std::size_t i = 0; i < kSections.size(); ++i) {
    buckets[i].title = kSections[i].title;
    buckets[i].include_file = kSections[i].include_file;
  }
  for (const auto& issue : report.issues()) {
    buckets[section_index(issue.category)].issues.push_back(&issue);
  }

  std::vector<IssueGroup> groups;
  for (auto& bucket : buckets) {
    if (!bucket.issues.empty()) {
      groups.push_back(std::move(bucket));
    }
  }
  return groups;
}

void write_issue_groups(const ValidationReport& report, std::ostream& out) {
  for (const auto& group : group_issues(report)) {
    out << group.title << " (" << group.issues.size() << "):\n";
    for (const auto* issue : group.issues) {
      if (group.include_file) {
        out << "  " << issue->file << ": " << issue->message << "\n";
      } else {
        out << "  " << issue->message << "\n";
      }
    }
    out << "\n";
  }
}

void write_report_text(const ValidationReport& report, std::ostream& out) {
  if (!report.has_errors()) {
    out << kNoIssuesMessage << "\n";
    return;
  }
  out << "Validation errors found (" << report.size() << " total):\n\n";
  write_issue_groups(report, out);
}

void write_issue_lines(const ValidationReport& report, std::ostream& out) {
  for (const auto& issue : report.issues()) {
    out << "  " << issue.file << ": " << issue.message << "\n";
  }
}

nlohmann::json report_to_json(const ValidationReport& report) {
  nlohmann::json j;
  j["valid"] = !report.has_errors();
  j["total"] = report.size();

  nlohmann::json counts = nlohmann::json::object();
  nlohmann::json issues = nlohmann::json::array();
  for (const auto& issue : report.issues()) {
    const std::string category(to_string(issue.category));
    counts[category] = counts.value(category, 0) + 1;

    nlohmann::json entry;
    entry["category"] = category;
    entry["file"] = issue.file;
    entry["message"] = issue.message;
    entry["rule_id"] = issue.rule_id;
    issues.push_back(std::move(entry));
  }
  j["counts"] = std::move(counts);
  j["issues"] = std::move(issues);
  return j;
}

}  // namespace kira::validation
