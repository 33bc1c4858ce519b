#pragma once

#include "kira/validation/item_rule.h"

namespace kira::validation {

// CONFIGURED-FIELDS: runs the field validator on every present field that has
// a schema entry, reporting one issue per invalid field.
class ConfiguredFieldsRule final : public ItemRule {
 public:
  ConfiguredFieldsRule() = default;

  [[nodiscard]] std::string_view rule_id() const noexcept override { return "configured-fields"; }
  [[nodiscard]] std::string_view description() const noexcept override {
    return "Configured fields satisfy their schema entry";
  }

  [[nodiscard]] std::vector<ValidationIssue> Validate(const ItemContext& context) const override;
};

}  // namespace kira::validation
