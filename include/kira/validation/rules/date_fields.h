#pragma once

#include "kira/validation/item_rule.h"

namespace kira::validation {

// DATE-FIELDS: fields without a schema entry whose name contains "date" or
// "due" must hold a %Y-%m-%d date when they hold a non-empty string.
// Configured fields are checked by CONFIGURED-FIELDS instead.
class DateFieldsRule final : public ItemRule {
 public:
  DateFieldsRule() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "date-fields"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Unconfigured date-like fields hold YYYY-MM-DD dates";
  }

  [[nodiscard]] std::vector<ValidationIssue> Validate(const ItemContext& context) const override;
};

}  // namespace kira::validation
