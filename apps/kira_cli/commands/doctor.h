#pragma once

// cmd_doctor: validate, apply the automatic repairs (duplicate IDs, created
// dates, field defaults and values), then re-validate and list what is left.
// Usage: kira_cli doctor [--root <dir>] [--strict]
int cmd_doctor(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
