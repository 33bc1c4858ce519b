#include "kira/validation/rules/created_date.h"

#include "kira/schema/date_format.h"

namespace kira::validation {

std::vector<ValidationIssue> CreatedDateRule::Validate(const ItemContext& context) const {
  std::vector<ValidationIssue> issues;
  const std::string& created = context.item.created;
  if (!created.empty() && !schema::DateFormat{}.parse(created).has_value()) {
    issues.push_back(
        issue(IssueCategory::kField, context, "invalid created date format: " + created));
  }
  return issues;
}

}  // namespace kira::validation
