#pragma once

#include "kira/core/result.h"
#include "kira/domain/work_item.h"

#include <string>
#include <string_view>
#include <vector>

namespace kira::frontmatter {

inline constexpr std::string_view kDelimiter = "---";

struct ParsedDocument {
  domain::WorkItem item;
  // Everything after the closing delimiter, split on '\n'. Joining with "\n"
  // reproduces the original bytes exactly.
  std::vector<std::string> body_lines;
  bool has_front_matter{false};
};

// parse_document extracts the YAML block delimited by the first non-empty line
// equal to "---" and the next such line.
//
// A document without an opening delimiter yields an empty item and keeps the
// whole text as body. Errors (kParse): unterminated front matter, malformed
// YAML, a non-mapping root, duplicate keys, a non-scalar hardcoded field.
[[nodiscard]] core::Result<ParsedDocument, core::Error> parse_document(std::string_view raw);

// write_document emits the canonical form: "---", the hardcoded fields in the
// order id, title, status, kind, created, the configurable fields sorted by
// name, "---", then the body lines unchanged.
// A value that cannot be emitted is a kParse error and nothing is produced.
[[nodiscard]] core::Result<std::string, core::Error> write_document(
    const domain::WorkItem& item, const std::vector<std::string>& body_lines);

// rewrite_id replaces only the top-level `id:` line inside the front matter and
// leaves every other byte of the document untouched.
[[nodiscard]] core::Result<std::string, core::Error> rewrite_id(std::string_view raw,
                                                                std::string_view new_id);

}  // namespace kira::frontmatter
