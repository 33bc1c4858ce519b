#pragma once

#include "kira/schema/field_config.h"

#include <array>
#include <map>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace kira::schema {

// The five fields every work item carries. They are validated by fixed rules
// and can never be configured under `fields`.
inline constexpr std::array<std::string_view, 5> kHardcodedFields = {
    "id", "title", "status", "kind", "created",
};

inline bool is_hardcoded_field(const std::string_view name) {
  for (const auto hardcoded : kHardcodedFields) {
    if (name == hardcoded) {
      return true;
    }
  }
  return false;
}

inline constexpr std::string_view kDefaultIdFormat = R"(^\d{3}$)";
inline constexpr std::string_view kDefaultWorkFolder = ".work";
inline constexpr std::string_view kDoingStatus = "doing";

struct ValidationSettings {
  std::vector<std::string> required_fields;
  std::string id_format;
  std::vector<std::string> status_values;
  bool strict{false};
};

// Schema is the validated, compiled form of kira.yml.
// Built once by the loader and then only read; every validator, resolver and
// fixer takes it by const reference.
struct Schema {
  std::map<std::string, FieldConfig> fields;
  ValidationSettings validation;
  std::map<std::string, std::string> status_folders;
  std::string work_folder{kDefaultWorkFolder};
  std::regex id_pattern;

  // Folder name (relative to the work folder) of the active/doing status.
  [[nodiscard]] std::string doing_folder() const {
    const auto it = status_folders.find(std::string(kDoingStatus));
    return it == status_folders.end() ? std::string{} : it->second;
  }
};

}  // namespace kira::schema
