#include "kira/validation/rules/configured_fields.h"

#include "kira/validation/field_validator.h"

namespace kira::validation {

std::vector<ValidationIssue> ConfiguredFieldsRule::Validate(const ItemContext& context) const {
  std::vector<ValidationIssue> issues;

  for (const auto& [name, value] : context.item.fields) {
    if (schema::is_hardcoded_field(name)) {
      continue;
    }
    const auto config = context.schema.fields.find(name);
    if (config == context.schema.fields.end()) {
      continue;
    }
    if (const auto problem = validate_field_value(value, config->second, context.clock)) {
      issues.push_back(
          issue(IssueCategory::kField, context, "field '" + name + "': " + *problem));
    }
  }
  return issues;
}

}  // namespace kira::validation
