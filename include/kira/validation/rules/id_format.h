#pragma once

#include "kira/validation/item_rule.h"

namespace kira::validation {

// ID-FORMAT: the id is searched with the compiled validation.id_format regex.
class IdFormatRule final : public ItemRule {
 public:
  IdFormatRule() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "id-format"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Item ID matches validation.id_format";
  }

  [[nodiscard]] std::vector<ValidationIssue> Validate(const ItemContext& context) const override;
};

}  // namespace kira::validation
