#include "kira/repair/repair_service.h"

#include "kira/frontmatter/codec.h"
#include "kira/repair/default_resolver.h"
#include "kira/repair/value_fixer.h"
#include "kira/schema/date_format.h"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <regex>
#include <utility>
#include <vector>

namespace kira::repair {

namespace {

using validation::IssueCategory;
using validation::ValidationReport;
using ReportResult = core::Result<ValidationReport, core::Error>;

constexpr std::string_view kFixFieldsRuleId = "fix-fields";
constexpr std::string_view kFixCreatedRuleId = "fix-created-date";
constexpr std::string_view kFixDuplicateRuleId = "fix-duplicate-id";
constexpr std::size_t kIdWidth = 3;
// Sort key for files whose modification time cannot be read.
constexpr std::int64_t kUnknownTime = std::numeric_limits<std::int64_t>::max();

IssueCategory category_of(const core::Error& error) {
  switch (error.kind) {
    case core::ErrorKind::kParse:
      return IssueCategory::kParse;
    case core::ErrorKind::kIo:
      return IssueCategory::kIo;
    default:
      return IssueCategory::kOther;
  }
}

// Serialises the item and replaces the file. Returns the error, if any.
std::optional<core::Error> write_item(workspace::IWorkItemStore& store, const std::string& file,
                                      const frontmatter::ParsedDocument& doc) {
  auto content = frontmatter::write_document(doc.item, doc.body_lines);
  if (!content.has_value()) {
    return content.error();
  }
  auto written = store.write(file, content.value());
  if (!written.has_value()) {
    return written.error();
  }
  return std::nullopt;
}

std::optional<std::int64_t> numeric_id(const std::string& id) {
  std::int64_t value = 0;
  const char* first = id.data();
  const char* last = id.data() + id.size();
  if (first != last && *first == '+') {
    ++first;
  }
  const auto [end, ec] = std::from_chars(first, last, value);
  if (first == last || ec != std::errc{} || end != last) {
    return std::nullopt;
  }
  return value;
}

std::string format_id(const std::int64_t value) {
  std::string text = std::to_string(value);
  if (text.size() < kIdWidth) {
    text.insert(0, kIdWidth - text.size(), '0');
  }
  return text;
}

// Corrects existing values of configured fields. Appends one message per fix.
bool fix_values(domain::WorkItem& item, const schema::Schema& schema,
                std::vector<std::string>& messages) {
  bool modified = false;
  for (const auto& [name, config] : schema.fields) {
    if (schema::is_hardcoded_field(name)) {
      continue;
    }
    const auto it = item.fields.find(name);
    if (it == item.fields.end() || it->second.is_empty()) {
      continue;
    }
    auto fixed = try_fix_field_value(it->second, config);
    if (!fixed.has_value()) {
      continue;
    }
    messages.push_back("fixed field '" + name + "': corrected value " +
                       it->second.display_string() + " -> " + fixed->display_string());
    it->second = std::move(*fixed);
    modified = true;
  }
  return modified;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Field repair
// ────────────────────────────────────────────────────────────────

ReportResult fix_field_issues(workspace::IWorkItemStore& store, const schema::Schema& schema,
                              const core::IClock& clock) {
  ValidationReport report;
  if (schema.fields.empty()) {
    return ReportResult::ok(std::move(report));
  }

  auto files = store.list_work_items();
  if (!files.has_value()) {
    return ReportResult::err(files.error());
  }

  const std::string rule_id(kFixFieldsRuleId);
  for (const auto& file : files.value()) {
    auto raw = store.read(file);
    if (!raw.has_value()) {
      report.add(rule_id, IssueCategory::kIo, file,
                 "failed to fix fields: " + raw.error().message);
      continue;
    }
    auto parsed = frontmatter::parse_document(raw.value());
    if (!parsed.has_value()) {
      report.add(rule_id, IssueCategory::kParse, file,
                 "failed to fix fields: failed to parse file: " + parsed.error().message);
      continue;
    }
    frontmatter::ParsedDocument& doc = parsed.value();

    auto added = apply_field_defaults(doc.item, schema, clock);
    if (!added.has_value()) {
      return ReportResult::err(added.error());
    }

    std::vector<std::string> messages;
    for (const auto& name : added.value()) {
      messages.push_back("fixed field '" + name + "': applied default value");
    }
    const bool values_fixed = fix_values(doc.item, schema, messages);

    if (added.value().empty() && !values_fixed) {
      continue;
    }
    if (const auto error = write_item(store, file, doc)) {
      report.add(rule_id, category_of(*error), file,
                 "failed to fix fields: failed to write fixes: " + error->message);
      continue;
    }
    for (auto& message : messages) {
      report.add(rule_id, IssueCategory::kFixed, file, std::move(message));
    }
  }
  return ReportResult::ok(std::move(report));
}

// ────────────────────────────────────────────────────────────────
// Created date repair
// ────────────────────────────────────────────────────────────────

ReportResult fix_created_dates(workspace::IWorkItemStore& store) {
  auto files = store.list_work_items();
  if (!files.has_value()) {
    return ReportResult::err(files.error());
  }

  ValidationReport report;
  const std::string rule_id(kFixCreatedRuleId);
  const schema::DateFormat iso;

  for (const auto& file : files.value()) {
    auto raw = store.read(file);
    if (!raw.has_value()) {
      continue;
    }
    auto parsed = frontmatter::parse_document(raw.value());
    if (!parsed.has_value()) {
      continue;
    }
    frontmatter::ParsedDocument& doc = parsed.value();

    const std::string original = doc.item.created;
    if (original.empty() || iso.parse(original).has_value()) {
      continue;
    }
    auto fixed = try_fix_date_string(original);
    if (!fixed.has_value()) {
      continue;
    }

    doc.item.created = *fixed;
    if (const auto error = write_item(store, file, doc)) {
      report.add(rule_id, category_of(*error), file,
                 "failed to fix created date: " + error->message);
      continue;
    }
    report.add(rule_id, IssueCategory::kFixed, file,
               "fixed created date format: " + original + " -> " + *fixed);
  }
  return ReportResult::ok(std::move(report));
}

// ────────────────────────────────────────────────────────────────
// Duplicate ID repair
// ────────────────────────────────────────────────────────────────

ReportResult fix_duplicate_ids(workspace::IWorkItemStore& store, const schema::Schema& schema) {
  auto files = store.list_work_items();
  if (!files.has_value()) {
    return ReportResult::err(files.error());
  }

  std::vector<std::string> id_order;
  std::map<std::string, std::vector<std::string>> files_by_id;
  for (const auto& file : files.value()) {
    auto raw = store.read(file);
    if (!raw.has_value()) {
      continue;
    }
    auto parsed = frontmatter::parse_document(raw.value());
    if (!parsed.has_value() || parsed.value().item.id.empty()) {
      continue;
    }
    const std::string& id = parsed.value().item.id;
    auto& group = files_by_id[id];
    if (group.empty()) {
      id_order.push_back(id);
    }
    group.push_back(file);
  }

  ValidationReport report;
  const std::string rule_id(kFixDuplicateRuleId);

  for (const auto& id : id_order) {
    auto& group = files_by_id[id];
    if (group.size() < 2) {
      continue;
    }

    // Oldest first; files without a known time sort last.
    std::stable_sort(group.begin(), group.end(), [&store](const auto& a, const auto& b) {
      const auto time_a = store.modified_time(a).value_or(kUnknownTime);
      const auto time_b = store.modified_time(b).value_or(kUnknownTime);
      if (time_a != time_b) {
        return time_a < time_b;
      }
      return a < b;
    });

    for (std::size_t i = 1; i < group.size(); ++i) {
      const std::string& file = group[i];

      auto new_id = next_id(store);
      if (!new_id.has_value()) {
        report.add(rule_id, category_of(new_id.error()), file,
                   "failed to generate new ID: " + new_id.error().message);
        continue;
      }
      if (!std::regex_search(new_id.value(), schema.id_pattern)) {
        report.add(rule_id, IssueCategory::kDuplicate, file,
                   "cannot fix duplicate ID " + id + ": generated ID " + new_id.value() +
                       " does not match format " + schema.validation.id_format);
        continue;
      }

      auto raw = store.read(file);
      if (!raw.has_value()) {
        report.add(rule_id, IssueCategory::kIo, file,
                   "failed to update ID: " + raw.error().message);
        continue;
      }
      auto rewritten = frontmatter::rewrite_id(raw.value(), new_id.value());
      if (!rewritten.has_value()) {
        report.add(rule_id, category_of(rewritten.error()), file,
                   "failed to update ID: " + rewritten.error().message);
        continue;
      }
      auto written = store.write(file, rewritten.value());
      if (!written.has_value()) {
        report.add(rule_id, IssueCategory::kIo, file,
                   "failed to update ID: " + written.error().message);
        continue;
      }
      report.add(rule_id, IssueCategory::kFixed, file,
                 "fixed duplicate ID: " + id + " -> " + new_id.value());
    }
  }
  return ReportResult::ok(std::move(report));
}

core::Result<std::string, core::Error> next_id(const workspace::IWorkItemStore& store) {
  using R = core::Result<std::string, core::Error>;

  auto files = store.list_work_items();
  if (!files.has_value()) {
    return R::err(files.error());
  }

  std::int64_t max_id = 0;
  for (const auto& file : files.value()) {
    auto raw = store.read(file);
    if (!raw.has_value()) {
      continue;
    }
    auto parsed = frontmatter::parse_document(raw.value());
    if (!parsed.has_value()) {
      continue;
    }
    if (const auto id = numeric_id(parsed.value().item.id); id && *id > max_id) {
      max_id = *id;
    }
  }
  if (max_id == std::numeric_limits<std::int64_t>::max()) {
    return R::err(core::Error{core::ErrorKind::kValidation,
                              "cannot generate next ID: highest ID " + std::to_string(max_id) +
                                  " is already the largest representable value"});
  }
  return R::ok(format_id(max_id + 1));
}

}  // namespace kira::repair
