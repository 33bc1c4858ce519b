#include "kira/schema/schema_loader.h"

#include "kira/core/normalization.h"

#include <yaml-cpp/yaml.h>

#include <array>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

namespace kira::schema {

namespace {

using SchemaResult = core::Result<Schema, core::Error>;
using FieldResult = core::Result<FieldConfig, core::Error>;

core::Error field_error(const std::string_view name, const std::string& message) {
  return core::configuration_error("field '" + std::string(name) + "': " + message);
}

// ────────────────────────────────────────────────────────────────
// YAML readers
// ────────────────────────────────────────────────────────────────

bool has_value(const YAML::Node& node) {
  return node.IsDefined() && !node.IsNull();
}

std::string read_string(const YAML::Node& node) {
  return has_value(node) ? node.as<std::string>() : std::string{};
}

std::vector<std::string> read_string_list(const YAML::Node& node) {
  return has_value(node) ? node.as<std::vector<std::string>>() : std::vector<std::string>{};
}

core::Result<FieldConfig, core::Error> parse_field_config(const std::string& name,
                                                         const YAML::Node& node) {
  FieldConfig config;
  if (!has_value(node)) {
    return FieldResult::err(field_error(name, "type is required"));
  }
  if (!node.IsMap()) {
    return FieldResult::err(field_error(name, "field configuration must be a mapping"));
  }

  const std::string type_text = read_string(node["type"]);
  if (type_text.empty()) {
    return FieldResult::err(field_error(name, "type is required"));
  }
  const auto type = parse_field_type(type_text);
  if (!type.has_value()) {
    return FieldResult::err(field_error(
        name, "invalid type '" + type_text +
                  "'. Valid types: string, date, email, url, number, array, enum"));
  }
  config.type = *type;

  if (has_value(node["required"])) {
    config.required = node["required"].as<bool>();
  }
  if (has_value(node["default"])) {
    config.default_value = domain::field_value_from_yaml(node["default"]);
  }
  config.format = read_string(node["format"]);
  config.allowed_values = read_string_list(node["allowed_values"]);
  config.description = read_string(node["description"]);
  config.display_name = read_string(node["display_name"]);
  config.category = read_string(node["category"]);
  if (has_value(node["deprecated"])) {
    config.deprecated = node["deprecated"].as<bool>();
  }
  if (has_value(node["min_length"])) {
    config.min_length = node["min_length"].as<int>();
  }
  if (has_value(node["max_length"])) {
    config.max_length = node["max_length"].as<int>();
  }
  if (has_value(node["min"])) {
    config.min_value = node["min"].as<double>();
  }
  if (has_value(node["max"])) {
    config.max_value = node["max"].as<double>();
  }
  config.min_date = read_string(node["min_date"]);
  config.max_date = read_string(node["max_date"]);
  if (has_value(node["unique"])) {
    config.unique = node["unique"].as<bool>();
  }
  config.schemes = read_string_list(node["schemes"]);
  if (has_value(node["case_sensitive"])) {
    config.case_sensitive = node["case_sensitive"].as<bool>();
  }

  const std::string item_type_text = read_string(node["item_type"]);
  if (!item_type_text.empty()) {
    config.item_type = parse_field_type(item_type_text);
    if (config.type == FieldType::kArray &&
        (!config.item_type.has_value() || !is_valid_item_type(*config.item_type))) {
      return FieldResult::err(field_error(name, "invalid item_type '" + item_type_text +
                                                    "' for array. Valid item types: string, "
                                                    "number, enum"));
    }
  }

  return FieldResult::ok(std::move(config));
}

void apply_validation_section(const YAML::Node& node, ValidationSettings& settings) {
  if (!node.IsMap()) {
    return;
  }
  // An explicit empty list is kept; only an absent key falls back to defaults.
  if (has_value(node["required_fields"])) {
    settings.required_fields = node["required_fields"].as<std::vector<std::string>>();
  }
  const std::string id_format = read_string(node["id_format"]);
  if (!id_format.empty()) {
    settings.id_format = id_format;
  }
  if (has_value(node["status_values"])) {
    settings.status_values = node["status_values"].as<std::vector<std::string>>();
  }
  if (has_value(node["strict"])) {
    settings.strict = node["strict"].as<bool>();
  }
}

// ────────────────────────────────────────────────────────────────
// Checks
// ────────────────────────────────────────────────────────────────

std::optional<std::string> check_relative_or_absolute_date(const std::string& value) {
  if (value.empty() || value == kRelativeToday || value == kRelativeFuture) {
    return std::nullopt;
  }
  if (DateFormat{}.parse(value).has_value()) {
    return std::nullopt;
  }
  return "expected YYYY-MM-DD, '" + std::string(kRelativeToday) + "' or '" +
         std::string(kRelativeFuture) + "'";
}

std::optional<std::string> check_constraints(const FieldConfig& config) {
  if (config.min_length && *config.min_length < 0) {
    return "min_length (" + std::to_string(*config.min_length) + ") cannot be negative";
  }
  if (config.max_length && *config.max_length < 0) {
    return "max_length (" + std::to_string(*config.max_length) + ") cannot be negative";
  }
  if (config.min_length && config.max_length && *config.min_length > *config.max_length) {
    return "min_length (" + std::to_string(*config.min_length) +
           ") cannot be greater than max_length (" + std::to_string(*config.max_length) + ")";
  }
  // A negative max with no (or a non-negative) min rejects every positive value.
  if (config.max_value && *config.max_value < 0 &&
      (!config.min_value || *config.min_value >= 0)) {
    return "max (" + domain::format_double(*config.max_value) +
           ") cannot be negative when min is not set or is non-negative";
  }
  if (config.min_value && config.max_value && *config.min_value > *config.max_value) {
    return "min (" + domain::format_double(*config.min_value) + ") cannot be greater than max (" +
           domain::format_double(*config.max_value) + ")";
  }
  if (const auto problem = check_relative_or_absolute_date(config.min_date)) {
    return "invalid min_date '" + config.min_date + "': " + *problem;
  }
  if (const auto problem = check_relative_or_absolute_date(config.max_date)) {
    return "invalid max_date '" + config.max_date + "': " + *problem;
  }
  return std::nullopt;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Public API
// ────────────────────────────────────────────────────────────────

Schema make_default_schema() {
  Schema schema;
  schema.validation.required_fields.assign(kHardcodedFields.begin(), kHardcodedFields.end());
  schema.validation.id_format = std::string(kDefaultIdFormat);
  schema.validation.status_values = {"backlog", "todo",     "doing",     "review",
                                     "done",    "released", "abandoned", "archived"};
  schema.validation.strict = false;
  schema.status_folders = {
      {"backlog", "0_backlog"}, {"todo", "1_todo"}, {"doing", "2_doing"},
      {"review", "3_review"},   {"done", "4_done"}, {"archived", "z_archive"},
  };
  schema.work_folder = std::string(kDefaultWorkFolder);
  schema.id_pattern = std::regex(schema.validation.id_format, std::regex::ECMAScript);
  return schema;
}

FieldResult compile_field_config(const std::string_view name, FieldConfig config) {
  if (name.empty()) {
    return FieldResult::err(core::configuration_error("field name cannot be empty"));
  }

  if (config.type == FieldType::kEnum && config.allowed_values.empty()) {
    return FieldResult::err(field_error(name, "enum type requires allowed_values"));
  }

  if (config.type == FieldType::kArray) {
    if (!config.item_type.has_value()) {
      return FieldResult::err(field_error(name, "array type requires item_type"));
    }
    if (!is_valid_item_type(*config.item_type)) {
      return FieldResult::err(field_error(name, "invalid item_type '" +
                                                    to_string(*config.item_type) +
                                                    "' for array. Valid item types: string, "
                                                    "number, enum"));
    }
    if (*config.item_type == FieldType::kEnum && config.allowed_values.empty()) {
      return FieldResult::err(
          field_error(name, "array with enum item_type requires allowed_values"));
    }
  }

  if (config.type == FieldType::kString && !config.format.empty()) {
    try {
      config.pattern.emplace(config.format, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      return FieldResult::err(
          field_error(name, "invalid regex format '" + config.format + "': " + e.what()));
    }
  }

  if (config.type == FieldType::kDate) {
    auto compiled = DateFormat::compile(config.format);
    if (!compiled.has_value()) {
      return FieldResult::err(field_error(name, compiled.error().message));
    }
    if (const auto problem = check_date_format(compiled.value())) {
      return FieldResult::err(field_error(name, *problem));
    }
    config.date_format = std::move(compiled.value());
  }

  if (const auto problem = check_constraints(config)) {
    return FieldResult::err(field_error(name, *problem));
  }

  for (auto& scheme : config.schemes) {
    scheme = core::normalize_ascii_lower(scheme);
  }

  return FieldResult::ok(std::move(config));
}

SchemaResult compile_schema(Schema schema) {
  if (core::trim(schema.work_folder).empty()) {
    return SchemaResult::err(
        core::configuration_error("workspace.work_folder cannot be empty or whitespace only"));
  }
  if (schema.work_folder.find('\0') != std::string::npos) {
    return SchemaResult::err(
        core::configuration_error("workspace.work_folder cannot contain null byte"));
  }

  if (schema.validation.id_format.empty()) {
    schema.validation.id_format = std::string(kDefaultIdFormat);
  }
  try {
    schema.id_pattern = std::regex(schema.validation.id_format, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    return SchemaResult::err(core::configuration_error(
        "invalid validation.id_format '" + schema.validation.id_format + "': " + e.what()));
  }

  // Hardcoded names are rejected before any per-field check.
  for (const auto& [name, config] : schema.fields) {
    if (is_hardcoded_field(name)) {
      return SchemaResult::err(core::configuration_error(
          "field '" + name + "' cannot be configured and must use hardcoded validation"));
    }
  }

  for (auto& [name, config] : schema.fields) {
    auto compiled = compile_field_config(name, std::move(config));
    if (!compiled.has_value()) {
      return SchemaResult::err(compiled.error());
    }
    config = std::move(compiled.value());
  }

  return SchemaResult::ok(std::move(schema));
}

SchemaResult load_schema_from_yaml(const std::string_view text) {
  Schema schema = make_default_schema();

  try {
    const YAML::Node root = YAML::Load(std::string(text));
    if (has_value(root) && !root.IsMap()) {
      return SchemaResult::err(
          core::configuration_error("failed to parse config file: root must be a mapping"));
    }

    if (has_value(root) && has_value(root["fields"])) {
      const YAML::Node fields = root["fields"];
      if (!fields.IsMap()) {
        return SchemaResult::err(
            core::configuration_error("failed to parse config file: fields must be a mapping"));
      }
      for (const auto& entry : fields) {
        const auto name = entry.first.as<std::string>();
        if (is_hardcoded_field(name)) {
          return SchemaResult::err(core::configuration_error(
              "field '" + name + "' cannot be configured and must use hardcoded validation"));
        }
        auto parsed = parse_field_config(name, entry.second);
        if (!parsed.has_value()) {
          return SchemaResult::err(parsed.error());
        }
        schema.fields[name] = std::move(parsed.value());
      }
    }

    if (has_value(root)) {
      apply_validation_section(root["validation"], schema.validation);

      const YAML::Node folders = root["status_folders"];
      if (has_value(folders) && folders.IsMap()) {
        for (const auto& entry : folders) {
          schema.status_folders[entry.first.as<std::string>()] = read_string(entry.second);
        }
      }

      const YAML::Node workspace = root["workspace"];
      if (has_value(workspace) && workspace.IsMap() && workspace["work_folder"].IsDefined()) {
        const YAML::Node work_folder = workspace["work_folder"];
        // An explicit empty value keeps the default; whitespace is rejected below.
        const std::string value = read_string(work_folder);
        if (!value.empty()) {
          schema.work_folder = value;
        }
      }
    }
  } catch (const YAML::Exception& e) {
    return SchemaResult::err(
        core::configuration_error(std::string("failed to parse config file: ") + e.what()));
  }

  return compile_schema(std::move(schema));
}

SchemaResult load_schema(const std::filesystem::path& root) {
  const std::array<std::filesystem::path, 2> candidates = {
      root / std::string(kConfigFileName),
      root / std::string(kDefaultWorkFolder) / std::string(kConfigFileName),
  };

  for (const auto& candidate : candidates) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec)) {
      continue;
    }

    std::ifstream in(candidate, std::ios::binary);
    if (!in) {
      return SchemaResult::err(core::configuration_error("failed to read config file: " +
                                                         candidate.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return load_schema_from_yaml(buffer.str());
  }

  return compile_schema(make_default_schema());
}

}  // namespace kira::schema
