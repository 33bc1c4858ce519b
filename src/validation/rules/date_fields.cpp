#include "kira/validation/rules/date_fields.h"

#include "kira/schema/date_format.h"

namespace kira::validation {

namespace {

bool looks_like_date_field(const std::string& name) {
  return name.find("date") != std::string::npos || name.find("due") != std::string::npos;
}

}  // namespace

std::vector<ValidationIssue> DateFieldsRule::Validate(const ItemContext& context) const {
  std::vector<ValidationIssue> issues;
  const schema::DateFormat iso;

  for (const auto& [name, value] : context.item.fields) {
    if (context.schema.fields.count(name) != 0 || !looks_like_date_field(name)) {
      continue;
    }
    if (!value.is_string() || value.as_string().empty()) {
      continue;
    }
    if (!iso.parse(value.as_string()).has_value()) {
      issues.push_back(issue(IssueCategory::kField, context,
                             "invalid " + name + " date format: " + value.as_string()));
    }
  }
  return issues;
}

}  // namespace kira::validation
