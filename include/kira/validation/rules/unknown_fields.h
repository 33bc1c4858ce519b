#pragma once

#include "kira/validation/item_rule.h"

namespace kira::validation {

// UNKNOWN-FIELDS: in strict mode every non-hardcoded field must have a schema
// entry. All offenders are reported in one sorted issue.
class UnknownFieldsRule final : public ItemRule {
 public:
  UnknownFieldsRule() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "unknown-fields"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "No unconfigured fields in strict mode";
  }

  [[nodiscard]] std::vector<ValidationIssue> Validate(const ItemContext& context) const override;
};

}  // namespace kira::validation
