#pragma once

#include "kira/core/clock.h"
#include "kira/core/result.h"
#include "kira/schema/schema.h"
#include "kira/validation/validation_report.h"
#include "kira/workspace/work_item_store.h"

#include <string>

namespace kira::repair {

// Repair passes rewrite work items in place through the store. Each applied
// fix is recorded in the returned report with category kFixed; per-file
// failures (unreadable, unparsable, unwritable) are recorded alongside and
// never stop the pass. A file is only written when something changed, and a
// failed write leaves the previous content in place.

// fix_field_issues applies configured defaults to missing or empty fields,
// then repairs existing values (see try_fix_field_value). An unusable default
// is a kConfiguration error and aborts the pass.
[[nodiscard]] core::Result<validation::ValidationReport, core::Error> fix_field_issues(
    workspace::IWorkItemStore& store, const schema::Schema& schema, const core::IClock& clock);

// fix_created_dates rewrites `created` values that are not YYYY-MM-DD but are
// in a recognised encoding. Files that fail to parse are skipped.
[[nodiscard]] core::Result<validation::ValidationReport, core::Error> fix_created_dates(
    workspace::IWorkItemStore& store);

// fix_duplicate_ids keeps the ID on the oldest file of each duplicate group
// (modification time, then path) and gives every other file the next free ID.
// Only the `id:` line of a rewritten file changes. A generated ID that does
// not match validation.id_format is reported instead of written.
[[nodiscard]] core::Result<validation::ValidationReport, core::Error> fix_duplicate_ids(
    workspace::IWorkItemStore& store, const schema::Schema& schema);

// next_id returns the highest numeric ID in the store plus one, zero-padded to
// three digits ("001" for an empty store). Non-numeric IDs and files that fail
// to parse are ignored.
[[nodiscard]] core::Result<std::string, core::Error> next_id(
    const workspace::IWorkItemStore& store);

}  // namespace kira::repair
