#include "kira/validation/report_format.h"

#include <catch2/catch.hpp>

#include <sstream>

using kira::validation::IssueCategory;
using kira::validation::ValidationReport;

namespace {

ValidationReport sample_report() {
  ValidationReport report;
  report.add("parse", IssueCategory::kParse, "1_todo/bad.md", "failed to parse file: oops");
  report.add("status", IssueCategory::kOther, "1_todo/a.md",
             "invalid status 'x'. Valid values: todo");
  report.add("id-format", IssueCategory::kField, "1_todo/a.md",
             "invalid ID format: 1 (expected format: ^\\d{3}$)");
  report.add("workflow", IssueCategory::kWorkflow, "workflow", "multiple items in doing folder");
  report.add("configured-fields", IssueCategory::kField, "1_todo/b.md", "field 'p': bad");
  return report;
}

}  // namespace

TEST_CASE("Issues are grouped in a fixed section order", "[validation][report_format]") {
  const auto report = sample_report();
  const auto groups = kira::validation::group_issues(report);

  REQUIRE(groups.size() == 4);
  REQUIRE(groups[0].title == "Field Validation Errors");
  REQUIRE(groups[0].issues.size() == 2);
  REQUIRE(groups[0].issues[0]->file == "1_todo/a.md");
  REQUIRE(groups[1].title == "Workflow Errors");
  REQUIRE_FALSE(groups[1].include_file);
  REQUIRE(groups[2].title == "Parse Errors");
  REQUIRE(groups[3].title == "Other Errors");
}

TEST_CASE("Text report", "[validation][report_format]") {
  SECTION("empty reports print the success line") {
    std::ostringstream out;
    kira::validation::write_report_text(ValidationReport{}, out);
    REQUIRE(out.str() == "No issues found. All work items are valid.\n");
  }

  SECTION("issues are printed under their sections") {
    std::ostringstream out;
    kira::validation::write_report_text(sample_report(), out);
    REQUIRE(out.str() ==
            "Validation errors found (5 total):\n"
            "\n"
            "Field Validation Errors (2):\n"
            "  1_todo/a.md: invalid ID format: 1 (expected format: ^\\d{3}$)\n"
            "  1_todo/b.md: field 'p': bad\n"
            "\n"
            "Workflow Errors (1):\n"
            "  multiple items in doing folder\n"
            "\n"
            "Parse Errors (1):\n"
            "  1_todo/bad.md: failed to parse file: oops\n"
            "\n"
            "Other Errors (1):\n"
            "  1_todo/a.md: invalid status 'x'. Valid values: todo\n"
            "\n");
  }

  SECTION("flat issue lines keep report order") {
    ValidationReport fixes;
    fixes.add("fix-created-date", IssueCategory::kFixed, "1_todo/a.md", "fixed created date");
    fixes.add("fix-fields", IssueCategory::kFixed, "1_todo/b.md", "fixed field 'x'");
    std::ostringstream out;
    kira::validation::write_issue_lines(fixes, out);
    REQUIRE(out.str() == "  1_todo/a.md: fixed created date\n  1_todo/b.md: fixed field 'x'\n");
  }
}

TEST_CASE("JSON report", "[validation][report_format]") {
  const auto json = kira::validation::report_to_json(sample_report());

  REQUIRE(json["valid"] == false);
  REQUIRE(json["total"] == 5);
  REQUIRE(json["counts"]["field"] == 2);
  REQUIRE(json["counts"]["workflow"] == 1);
  REQUIRE_FALSE(json["counts"].contains("duplicate"));
  REQUIRE(json["issues"].size() == 5);
  REQUIRE(json["issues"][0]["category"] == "parse");
  REQUIRE(json["issues"][0]["rule_id"] == "parse");
  REQUIRE(json["issues"][0]["file"] == "1_todo/bad.md");

  const auto empty = kira::validation::report_to_json(ValidationReport{});
  REQUIRE(empty["valid"] == true);
  REQUIRE(empty["counts"].empty());
  REQUIRE(empty["issues"].is_array());
}
