#include "kira/validation/rules/required_fields.h"

namespace kira::validation {

namespace {

const std::string* hardcoded_value(const domain::WorkItem& item, const std::string& name) {
  if (name == "id") {
    return &item.id;
  }
  if (name == "title") {
    return &item.title;
  }
  if (name == "status") {
    return &item.status;
  }
  if (name == "kind") {
    return &item.kind;
  }
  if (name == "created") {
    return &item.created;
  }
  return nullptr;
}

}  // namespace

std::vector<ValidationIssue> RequiredFieldsRule::Validate(const ItemContext& context) const {
  std::vector<ValidationIssue> issues;

  // Names in required_fields that are not hardcoded are ignored here; a
  // configurable field is required through its own `required` flag.
  for (const auto& name : context.schema.validation.required_fields) {
    const std::string* value = hardcoded_value(context.item, name);
    if (value != nullptr && value->empty()) {
      issues.push_back(issue(IssueCategory::kOther, context, "missing required field: " + name));
    }
  }

  for (const auto& [name, config] : context.schema.fields) {
    if (!config.required) {
      continue;
    }
    const auto it = context.item.fields.find(name);
    if (it == context.item.fields.end() || it->second.is_empty()) {
      issues.push_back(issue(IssueCategory::kOther, context, "missing required field: " + name));
    }
  }

  return issues;
}

}  // namespace kira::validation
