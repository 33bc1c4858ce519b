#pragma once

#include "kira/validation/item_rule.h"

namespace kira::validation {

// CREATED-DATE: a non-empty `created` must parse as %Y-%m-%d. Emptiness is
// left to REQUIRED-FIELDS.
class CreatedDateRule final : public ItemRule {
 public:
  CreatedDateRule() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "created-date"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Created date is a strict YYYY-MM-DD date";
  }

  [[nodiscard]] std::vector<ValidationIssue> Validate(const ItemContext& context) const override;
};

}  // namespace kira::validation
