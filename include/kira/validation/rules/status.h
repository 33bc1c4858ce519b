#pragma once

#include "kira/validation/item_rule.h"

namespace kira::validation {

// STATUS: exact, case-sensitive membership in validation.status_values.
class StatusRule final : public ItemRule {
 public:
  StatusRule() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "status"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Status is one of validation.status_values";
  }

  [[nodiscard]] std::vector<ValidationIssue> Validate(const ItemContext& context) const override;
};

}  // namespace kira::validation
