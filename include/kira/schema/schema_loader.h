#pragma once

#include "kira/core/result.h"
#include "kira/schema/schema.h"

#include <filesystem>
#include <string_view>

namespace kira::schema {

inline constexpr std::string_view kConfigFileName = "kira.yml";

// Built-in schema used when no kira.yml exists: default status folders,
// required fields, ID format and status values, no configurable fields.
[[nodiscard]] Schema make_default_schema();

// Checks one field entry and compiles its format (regex or date pattern).
// Errors are kConfiguration and prefixed with "field '<name>': ".
[[nodiscard]] core::Result<FieldConfig, core::Error> compile_field_config(std::string_view name,
                                                                        FieldConfig config);

// Merges defaults into a partially filled schema, validates every section and
// compiles the ID pattern and field formats.
[[nodiscard]] core::Result<Schema, core::Error> compile_schema(Schema schema);

// Parses kira.yml text. Unknown keys are ignored, missing sections fall back
// to make_default_schema() values.
[[nodiscard]] core::Result<Schema, core::Error> load_schema_from_yaml(std::string_view text);

// Looks for <root>/kira.yml, then <root>/.work/kira.yml; returns the default
// schema when neither exists.
[[nodiscard]] core::Result<Schema, core::Error> load_schema(const std::filesystem::path& root);

}  // namespace kira::schema
