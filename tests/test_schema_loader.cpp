#include "kira/schema/schema_loader.h"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <regex>
#include <string>

using kira::core::ErrorKind;
using kira::schema::FieldType;
using kira::schema::load_schema_from_yaml;

namespace {

std::string error_of(const std::string& yaml) {
  const auto result = load_schema_from_yaml(yaml);
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().kind == ErrorKind::kConfiguration);
  return result.error().message;
}

}  // namespace

TEST_CASE("Default schema", "[schema][loader]") {
  const auto schema = kira::schema::make_default_schema();
  REQUIRE(schema.fields.empty());
  REQUIRE(schema.work_folder == ".work");
  REQUIRE(schema.validation.required_fields.size() == 5);
  REQUIRE(schema.validation.id_format == "^\\d{3}$");
  REQUIRE(schema.doing_folder() == "2_doing");
  REQUIRE(std::regex_search("007", schema.id_pattern));
  REQUIRE_FALSE(std::regex_search("07", schema.id_pattern));

  SECTION("empty text loads the defaults") {
    const auto loaded = load_schema_from_yaml("");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded.value().validation.status_values.size() == 8);
  }
}

TEST_CASE("Loading a full configuration", "[schema][loader]") {
  const auto loaded = load_schema_from_yaml(R"(
fields:
  assigned:
    type: email
    required: true
  due:
    type: date
    format: "%d.%m.%Y"
    min_date: today
  priority:
    type: enum
    allowed_values: [low, medium, high]
    default: medium
    case_sensitive: false
  tags:
    type: array
    item_type: string
    unique: true
  estimate:
    type: number
    min: 0
    max: 40
validation:
  id_format: "^[A-Z]{2}-\\d+$"
  status_values: [todo, doing, done]
  strict: true
status_folders:
  doing: active
workspace:
  work_folder: tasks
unknown_top_level: ignored
)");
  REQUIRE(loaded.has_value());
  const auto& schema = loaded.value();

  REQUIRE(schema.fields.size() == 5);
  REQUIRE(schema.fields.at("assigned").required);
  REQUIRE(schema.fields.at("due").type == FieldType::kDate);
  REQUIRE(schema.fields.at("due").date_format.pattern() == "%d.%m.%Y");
  REQUIRE(schema.fields.at("due").min_date == "today");
  REQUIRE(schema.fields.at("priority").default_value->as_string() == "medium");
  REQUIRE_FALSE(schema.fields.at("priority").is_case_sensitive());
  REQUIRE(schema.fields.at("tags").item_type == FieldType::kString);
  REQUIRE(schema.fields.at("estimate").max_value == 40.0);

  REQUIRE(schema.validation.strict);
  REQUIRE(schema.validation.status_values.size() == 3);
  REQUIRE(std::regex_search("AB-12", schema.id_pattern));
  REQUIRE(schema.doing_folder() == "active");
  REQUIRE(schema.status_folders.at("todo") == "1_todo");
  REQUIRE(schema.work_folder == "tasks");

  SECTION("unset validation keys keep their defaults") {
    REQUIRE(schema.validation.required_fields.size() == 5);
  }
}

TEST_CASE("Configuration errors", "[schema][loader]") {
  REQUIRE(error_of("fields:\n  id:\n    type: string\n") ==
          "field 'id' cannot be configured and must use hardcoded validation");
  REQUIRE(error_of("fields:\n  x:\n    required: true\n") == "field 'x': type is required");
  REQUIRE(error_of("fields:\n  x:\n    type: text\n") ==
          "field 'x': invalid type 'text'. Valid types: string, date, email, url, number, "
          "array, enum");
  REQUIRE(error_of("fields:\n  x:\n    type: enum\n") ==
          "field 'x': enum type requires allowed_values");
  REQUIRE(error_of("fields:\n  x:\n    type: array\n") ==
          "field 'x': array type requires item_type");
  REQUIRE(error_of("fields:\n  x:\n    type: array\n    item_type: date\n") ==
          "field 'x': invalid item_type 'date' for array. Valid item types: string, number, "
          "enum");
  REQUIRE(error_of("fields:\n  x:\n    type: array\n    item_type: enum\n") ==
          "field 'x': array with enum item_type requires allowed_values");
  REQUIRE(error_of("fields:\n  x:\n    type: string\n    min_length: 5\n    max_length: 2\n") ==
          "field 'x': min_length (5) cannot be greater than max_length (2)");
  REQUIRE(error_of("fields:\n  x:\n    type: string\n    min_length: -1\n") ==
          "field 'x': min_length (-1) cannot be negative");
  REQUIRE(error_of("fields:\n  x:\n    type: number\n    min: 5\n    max: 1\n") ==
          "field 'x': min (5) cannot be greater than max (1)");
  REQUIRE(error_of("fields:\n  x:\n    type: number\n    max: -1\n") ==
          "field 'x': max (-1) cannot be negative when min is not set or is non-negative");
  REQUIRE(error_of("fields:\n  x:\n    type: date\n    min_date: soon\n") ==
          "field 'x': invalid min_date 'soon': expected YYYY-MM-DD, 'today' or 'future'");
  REQUIRE(error_of("workspace:\n  work_folder: \"   \"\n") ==
          "workspace.work_folder cannot be empty or whitespace only");

  SECTION("bad regexes are configuration errors") {
    const std::string message = error_of("fields:\n  x:\n    type: string\n    format: \"([\"\n");
    REQUIRE(message.rfind("field 'x': invalid regex format '(['", 0) == 0);
    REQUIRE(error_of("validation:\n  id_format: \"(\"\n").rfind("invalid validation.id_format",
                                                             0) == 0);
  }

  SECTION("malformed YAML") {
    REQUIRE(error_of("fields: [unclosed\n").rfind("failed to parse config file: ", 0) == 0);
    REQUIRE(error_of("- a\n- b\n") == "failed to parse config file: root must be a mapping");
  }

  SECTION("a negative max is fine when min is negative too") {
    REQUIRE(load_schema_from_yaml("fields:\n  x:\n    type: number\n    min: -5\n    max: -1\n")
                .has_value());
  }
}

TEST_CASE("load_schema finds kira.yml on disk", "[schema][loader]") {
  namespace fs = std::filesystem;
  const fs::path root = fs::temp_directory_path() / "kira_schema_loader_test";
  fs::remove_all(root);
  fs::create_directories(root / ".work");

  SECTION("no file falls back to defaults") {
    const auto loaded = kira::schema::load_schema(root);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded.value().fields.empty());
  }

  SECTION("the work folder copy is used when the root has none") {
    std::ofstream(root / ".work" / "kira.yml") << "validation:\n  strict: true\n";
    const auto loaded = kira::schema::load_schema(root);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded.value().validation.strict);
  }

  SECTION("the root file wins") {
    std::ofstream(root / ".work" / "kira.yml") << "validation:\n  strict: true\n";
    std::ofstream(root / "kira.yml") << "validation:\n  strict: false\n";
    const auto loaded = kira::schema::load_schema(root);
    REQUIRE(loaded.has_value());
    REQUIRE_FALSE(loaded.value().validation.strict);
  }

  fs::remove_all(root);
}
