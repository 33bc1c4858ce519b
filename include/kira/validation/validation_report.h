#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kira::validation {

// Display grouping used by the CLI when printing a report.
enum class IssueCategory {
  kField,
  kUnknownField,
  kWorkflow,
  kDuplicate,
  kParse,
  kIo,
  kFixed,
  kOther,
};

inline std::string_view to_string(const IssueCategory category) {
  switch (category) {
    case IssueCategory::kField:
      return "field";
    case IssueCategory::kUnknownField:
      return "unknown_field";
    case IssueCategory::kWorkflow:
      return "workflow";
    case IssueCategory::kDuplicate:
      return "duplicate";
    case IssueCategory::kParse:
      return "parse";
    case IssueCategory::kIo:
      return "io";
    case IssueCategory::kFixed:
      return "fixed";
    case IssueCategory::kOther:
      return "other";
  }
  return "other";
}

// File name attached to workflow issues, which belong to no single file.
inline constexpr std::string_view kWorkflowFile = "workflow";

// One entry of a report: a violation during validation, or an applied fix
// during repair (category kFixed).
struct ValidationIssue {
  std::string rule_id;
  IssueCategory category{IssueCategory::kOther};
  std::string file;
  std::string message;
};

// ValidationReport accumulates issues in the order they were found.
// Per-file problems never stop a run, so a report may hold many entries.
class ValidationReport {
 public:
  void add(std::string rule_id, IssueCategory category, std::string file, std::string message) {
    issues_.push_back(
        ValidationIssue{std::move(rule_id), category, std::move(file), std::move(message)});
  }

  void append(const ValidationReport& other) {
    issues_.insert(issues_.end(), other.issues_.begin(), other.issues_.end());
  }

  [[nodiscard]] bool has_errors() const noexcept { return !issues_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return issues_.size(); }
  [[nodiscard]] const std::vector<ValidationIssue>& issues() const noexcept { return issues_; }

 private:
  std::vector<ValidationIssue> issues_;
};

}  // namespace kira::validation
