#pragma once

#include "kira/validation/item_rule.h"

namespace kira::validation {

// REQUIRED-FIELDS: every name in validation.required_fields that is a hardcoded
// field must be non-empty, and every configured field with `required: true`
// must be present with a non-empty value. One issue per missing field.
class RequiredFieldsRule final : public ItemRule {
 public:
  RequiredFieldsRule() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "required-fields"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Required hardcoded and configured fields are present and non-empty";
  }

  [[nodiscard]] std::vector<ValidationIssue> Validate(const ItemContext& context) const override;
};

}  // namespace kira::validation
