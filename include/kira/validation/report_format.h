#pragma once

#include "kira/validation/validation_report.h"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string_view>
#include <vector>

namespace kira::validation {

// IssueGroup is one titled section of the text report.
// Workflow issues belong to no file, so their group prints messages only.
struct IssueGroup {
  std::string_view title;                      // NOLINT(readability-identifier-naming)
  bool include_file{true};                     // NOLINT(readability-identifier-naming)
  std::vector<const ValidationIssue*> issues;  // NOLINT(readability-identifier-naming)
};

// group_issues sorts issues into the fixed section order
// Field Validation Errors, Unknown Fields, Workflow Errors, Duplicate ID Errors,
// Parse Errors, Other Errors. Empty sections are omitted; issues keep report order.
// The pointers stay valid as long as `report` does.
[[nodiscard]] std::vector<IssueGroup> group_issues(const ValidationReport& report);

// Writes every non-empty section as "<title> (<n>):" followed by indented
// "  <file>: <message>" lines and a blank line.
void write_issue_groups(const ValidationReport& report, std::ostream& out);

// Writes the "Validation errors found (<n> total):" header and the sections,
// or a single success line for an empty report.
void write_report_text(const ValidationReport& report, std::ostream& out);

// Writes one "  <file>: <message>" line per issue, in report order.
void write_issue_lines(const ValidationReport& report, std::ostream& out);

// JSON form of a report:
//   {"valid": bool, "total": n, "counts": {"<category>": n, ...},
//    "issues": [{"category", "file", "message", "rule_id"}, ...]}
// Keys are alphabetically sorted by nlohmann::json's std::map default.
[[nodiscard]] nlohmann::json report_to_json(const ValidationReport& report);

}  // namespace kira::validation
