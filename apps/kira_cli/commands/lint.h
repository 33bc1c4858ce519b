#pragma once

// cmd_lint: validate every work item and print the categorized report.
// Usage: kira_cli lint [--root <dir>] [--strict] [--format <text|json>]
// Exit code 1 when any issue is found.
int cmd_lint(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
