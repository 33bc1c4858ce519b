#pragma once

#include "kira/core/clock.h"
#include "kira/domain/work_item.h"
#include "kira/schema/schema.h"
#include "kira/validation/validation_report.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kira::validation {

// Everything a per-item rule may look at. The schema and clock are shared by
// every rule of a run and never mutated.
struct ItemContext {
  std::string file;  // path relative to the work folder
  const domain::WorkItem& item;
  const schema::Schema& schema;
  const core::IClock& clock;
};

// ItemRule is the abstract base class for per-item validation rules.
// Rules see one parsed item at a time; cross-file checks (duplicate IDs, the
// single-item doing folder) live in ValidationEngine.
class ItemRule {
 public:
  virtual ~ItemRule() = default;

  [[nodiscard]] virtual std::string_view rule_id() const noexcept = 0;
  [[nodiscard]] virtual std::string_view description() const noexcept = 0;

  // Returns the issues found for context.item; empty when the item passes.
  [[nodiscard]] virtual std::vector<ValidationIssue> Validate(const ItemContext& context) const = 0;

 protected:
  ItemRule() = default;
  ItemRule(const ItemRule&) = default;
  ItemRule& operator=(const ItemRule&) = default;
  ItemRule(ItemRule&&) = default;
  ItemRule& operator=(ItemRule&&) = default;

  [[nodiscard]] ValidationIssue issue(IssueCategory category, const ItemContext& context,
                                      std::string message) const {
    return ValidationIssue{std::string(rule_id()), category, context.file, std::move(message)};
  }
};

}  // namespace kira::validation
