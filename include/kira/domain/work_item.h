#pragma once

#include "kira/domain/field_value.h"

#include <map>
#include <string>

namespace kira::domain {

// WorkItem is the parsed front matter of one markdown document.
// The hardcoded fields hold their raw scalar text so "id: 001" stays "001".
// Configurable fields are kept in a sorted map, which is also their write order.
// Invariant: no hardcoded field name is ever a key of `fields`.
struct WorkItem {
  std::string id;       // NOLINT(readability-identifier-naming)
  std::string title;    // NOLINT(readability-identifier-naming)
  std::string status;   // NOLINT(readability-identifier-naming)
  std::string kind;     // NOLINT(readability-identifier-naming)
  std::string created;  // NOLINT(readability-identifier-naming)
  std::map<std::string, FieldValue> fields;
};

}  // namespace kira::domain
