#include "kira/validation/rules/status.h"

#include "kira/core/normalization.h"

#include <algorithm>

namespace kira::validation {

std::vector<ValidationIssue> StatusRule::Validate(const ItemContext& context) const {
  std::vector<ValidationIssue> issues;
  const auto& allowed = context.schema.validation.status_values;
  if (std::find(allowed.begin(), allowed.end(), context.item.status) == allowed.end()) {
    issues.push_back(issue(IssueCategory::kOther, context,
                           "invalid status '" + context.item.status +
                               "'. Valid values: " + core::join(allowed, ", ")));
  }
  return issues;
}

}  // namespace kira::validation
