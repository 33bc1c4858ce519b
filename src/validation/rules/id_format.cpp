#include "kira/validation/rules/id_format.h"

#include <regex>

namespace kira::validation {

std::vector<ValidationIssue> IdFormatRule::Validate(const ItemContext& context) const {
  std::vector<ValidationIssue> issues;
  if (!std::regex_search(context.item.id, context.schema.id_pattern)) {
    issues.push_back(issue(IssueCategory::kField, context,
                           "invalid ID format: " + context.item.id + " (expected format: " +
                               context.schema.validation.id_format + ")"));
  }
  return issues;
}

}  // namespace kira::validation
