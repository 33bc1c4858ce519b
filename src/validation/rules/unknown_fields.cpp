#include "kira/validation/rules/unknown_fields.h"

#include "kira/core/normalization.h"

namespace kira::validation {

std::vector<ValidationIssue> UnknownFieldsRule::Validate(const ItemContext& context) const {
  std::vector<ValidationIssue> issues;
  if (!context.schema.validation.strict) {
    return issues;
  }

  // item.fields is a std::map, so the names come out sorted.
  std::vector<std::string> unknown;
  for (const auto& [name, value] : context.item.fields) {
    if (!schema::is_hardcoded_field(name) && context.schema.fields.count(name) == 0) {
      unknown.push_back(name);
    }
  }

  if (!unknown.empty()) {
    issues.push_back(issue(IssueCategory::kUnknownField, context,
                           "unknown fields found (not in configuration): " +
                               core::join(unknown, ", ")));
  }
  return issues;
}

}  // namespace kira::validation
