#pragma once

// cmd_next_id: print the next free work item ID.
// Usage: kira_cli next-id [--root <dir>]
int cmd_next_id(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
