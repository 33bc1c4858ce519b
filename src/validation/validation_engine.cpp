#include "kira/validation/validation_engine.h"

#include "kira/core/normalization.h"
#include "kira/frontmatter/codec.h"
#include "kira/validation/rules/configured_fields.h"
#include "kira/validation/rules/created_date.h"
#include "kira/validation/rules/date_fields.h"
#include "kira/validation/rules/id_format.h"
#include "kira/validation/rules/required_fields.h"
#include "kira/validation/rules/status.h"
#include "kira/validation/rules/unknown_fields.h"

#include <map>
#include <string>
#include <utility>

namespace kira::validation {

namespace {

constexpr std::string_view kParseRuleId = "parse";
constexpr std::string_view kReadRuleId = "read";
constexpr std::string_view kDuplicateRuleId = "duplicate-id";
constexpr std::string_view kWorkflowRuleId = "workflow";

}  // namespace

ValidationEngine::ValidationEngine(const schema::Schema& schema, const core::IClock& clock,
                                   RuleList rules)
    : schema_(schema), clock_(clock), rules_(std::move(rules)) {}

core::Result<ValidationReport, core::Error> ValidationEngine::validate(
    const workspace::IWorkItemStore& store) const {
  using R = core::Result<ValidationReport, core::Error>;

  auto files = store.list_work_items();
  if (!files.has_value()) {
    return R::err(files.error());
  }

  ValidationReport report;
  // Ordered by first appearance so reports stay in discovery order.
  std::vector<std::string> id_order;
  std::map<std::string, std::vector<std::string>> files_by_id;

  for (const auto& file : files.value()) {
    auto raw = store.read(file);
    if (!raw.has_value()) {
      report.add(std::string(kReadRuleId), IssueCategory::kIo, file, raw.error().message);
      continue;
    }

    auto parsed = frontmatter::parse_document(raw.value());
    if (!parsed.has_value()) {
      report.add(std::string(kParseRuleId), IssueCategory::kParse, file,
                 "failed to parse file: " + parsed.error().message);
      continue;
    }

    const domain::WorkItem& item = parsed.value().item;
    const ItemContext context{file, item, schema_, clock_};
    for (const auto& rule : rules_) {
      if (!rule) {
        continue;
      }
      for (auto& issue : rule->Validate(context)) {
        report.add(std::move(issue.rule_id), issue.category, std::move(issue.file),
                   std::move(issue.message));
      }
    }

    if (!item.id.empty()) {
      auto& group = files_by_id[item.id];
      if (group.empty()) {
        id_order.push_back(item.id);
      }
      group.push_back(file);
    }
  }

  for (const auto& id : id_order) {
    const auto& group = files_by_id[id];
    if (group.size() > 1) {
      report.add(std::string(kDuplicateRuleId), IssueCategory::kDuplicate, group.front(),
                 "duplicate ID found: " + id + " in files " + core::join(group, ", "));
    }
  }

  const std::string doing = schema_.doing_folder();
  if (!doing.empty()) {
    auto doing_files = store.list_markdown_files_in(doing);
    if (!doing_files.has_value()) {
      report.add(std::string(kWorkflowRuleId), IssueCategory::kWorkflow,
                 std::string(kWorkflowFile),
                 "failed to read doing folder: " + doing_files.error().message);
    } else if (doing_files.value().size() > 1) {
      report.add(std::string(kWorkflowRuleId), IssueCategory::kWorkflow,
                 std::string(kWorkflowFile),
                 "multiple items in doing folder. Only one item allowed at a time. Found: " +
                     core::join(doing_files.value(), ", "));
    }
  }

  return R::ok(std::move(report));
}

RuleList ValidationEngine::make_default_rules() {
  RuleList rules;
  rules.push_back(std::make_unique<RequiredFieldsRule>());
  rules.push_back(std::make_unique<IdFormatRule>());
  rules.push_back(std::make_unique<StatusRule>());
  rules.push_back(std::make_unique<CreatedDateRule>());
  rules.push_back(std::make_unique<DateFieldsRule>());
  rules.push_back(std::make_unique<ConfiguredFieldsRule>());
  rules.push_back(std::make_unique<UnknownFieldsRule>());
  return rules;
}

}  // namespace kira::validation
