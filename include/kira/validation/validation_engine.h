#pragma once

#include "kira/core/clock.h"
#include "kira/core/result.h"
#include "kira/schema/schema.h"
#include "kira/validation/item_rule.h"
#include "kira/validation/validation_report.h"
#include "kira/workspace/work_item_store.h"

#include <memory>
#include <vector>

namespace kira::validation {

using RuleList = std::vector<std::unique_ptr<ItemRule>>;

// ValidationEngine validates every work item in a store against one schema.
//
// For each discovered file (sorted by path) the document is parsed and the
// rules run in list order; a file that fails to parse gets a single parse
// issue and skips the rules. After all files, duplicate non-empty IDs and the
// single-item doing folder are checked.
//
// Per-file problems never stop the run. Only a failure to list the store is
// returned as an error.
class ValidationEngine {
 public:
  ValidationEngine(const schema::Schema& schema, const core::IClock& clock,
                   RuleList rules = make_default_rules());

  [[nodiscard]] core::Result<ValidationReport, core::Error> validate(
      const workspace::IWorkItemStore& store) const;

  // Fixed evaluation order: required-fields, id-format, status, created-date,
  // date-fields, configured-fields, unknown-fields.
  static RuleList make_default_rules();

 private:
  const schema::Schema& schema_;
  const core::IClock& clock_;
  RuleList rules_;
};

}  // namespace kira::validation
