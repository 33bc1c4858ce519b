#include "kira/validation/field_validator.h"

#include "kira/schema/schema_loader.h"

#include <catch2/catch.hpp>

#include <initializer_list>
#include <string>

using kira::core::CalendarDate;
using kira::core::FixedClock;
using kira::domain::FieldValue;
using kira::schema::FieldConfig;
using kira::schema::FieldType;
using kira::validation::validate_field_value;

namespace {

const FixedClock kClock{CalendarDate{2024, 6, 15}};

FieldConfig compiled(FieldConfig config) {
  auto result = kira::schema::compile_field_config("test", std::move(config));
  REQUIRE(result.has_value());
  return result.value();
}

FieldConfig of_type(const FieldType type) {
  FieldConfig config;
  config.type = type;
  return config;
}

std::string problem_of(const FieldValue& value, const FieldConfig& config) {
  const auto problem = validate_field_value(value, config, kClock);
  return problem.value_or("");
}

}  // namespace

TEST_CASE("Type checks report the actual kind", "[validation][field_validator]") {
  REQUIRE(problem_of(FieldValue::integer(3), of_type(FieldType::kString)) ==
          "expected string, got integer");
  REQUIRE(problem_of(FieldValue::string("3"), of_type(FieldType::kNumber)) ==
          "expected number, got string");
  REQUIRE(problem_of(FieldValue::null(), of_type(FieldType::kDate)) ==
          "expected date string, got null");
  REQUIRE(problem_of(FieldValue::string("x"), of_type(FieldType::kArray)) ==
          "expected array, got string");
  REQUIRE(problem_of(FieldValue::boolean(true), of_type(FieldType::kUrl)) ==
          "expected URL string, got bool");
}

TEST_CASE("String fields", "[validation][field_validator]") {
  FieldConfig config = of_type(FieldType::kString);
  config.format = "^[A-Z]+-\\d+$";
  config.min_length = 3;
  config.max_length = 8;
  config = compiled(config);

  REQUIRE(problem_of(FieldValue::string("ABC-12"), config).empty());
  REQUIRE(problem_of(FieldValue::string("abc-12"), config) ==
          "value 'abc-12' does not match format pattern: ^[A-Z]+-\\d+$");
  REQUIRE(problem_of(FieldValue::string("ABCDEF-123"), config) ==
          "string length 10 is greater than max_length 8");

  SECTION("the format check runs before the length check") {
    REQUIRE(problem_of(FieldValue::string("a"), config) ==
            "value 'a' does not match format pattern: ^[A-Z]+-\\d+$");
  }

  SECTION("unanchored patterns match anywhere") {
    FieldConfig loose = of_type(FieldType::kString);
    loose.format = "\\d";
    loose = compiled(loose);
    REQUIRE(problem_of(FieldValue::string("abc1def"), loose).empty());
  }

  SECTION("min_length") {
    FieldConfig short_config = of_type(FieldType::kString);
    short_config.min_length = 2;
    REQUIRE(problem_of(FieldValue::string("a"), short_config) ==
            "string length 1 is less than min_length 2");
  }
}

TEST_CASE("Number fields", "[validation][field_validator]") {
  FieldConfig config = of_type(FieldType::kNumber);
  config.min_value = 1;
  config.max_value = 10;

  REQUIRE(problem_of(FieldValue::integer(5), config).empty());
  REQUIRE(problem_of(FieldValue::floating(9.5), config).empty());
  REQUIRE(problem_of(FieldValue::integer(0), config) == "value 0 is less than min 1");
  REQUIRE(problem_of(FieldValue::floating(10.5), config) == "value 10.5 is greater than max 10");
}

TEST_CASE("Date fields", "[validation][field_validator]") {
  SECTION("format") {
    FieldConfig config = of_type(FieldType::kDate);
    config.format = "%d/%m/%Y";
    config = compiled(config);
    REQUIRE(problem_of(FieldValue::string("15/01/2024"), config).empty());
    REQUIRE(problem_of(FieldValue::string("2024-01-15"), config) ==
            "date '2024-01-15' does not match format: %d/%m/%Y");
  }

  SECTION("absolute bounds") {
    FieldConfig config = of_type(FieldType::kDate);
    config.min_date = "2024-01-01";
    config.max_date = "2024-12-31";
    config = compiled(config);
    REQUIRE(problem_of(FieldValue::string("2024-05-01"), config).empty());
    REQUIRE(problem_of(FieldValue::string("2023-12-31"), config) ==
            "date 2023-12-31 is before min_date 2024-01-01");
    REQUIRE(problem_of(FieldValue::string("2025-01-01"), config) ==
            "date 2025-01-01 is after max_date 2024-12-31");
  }

  SECTION("relative bounds resolve against the clock") {
    FieldConfig past = of_type(FieldType::kDate);
    past.max_date = "today";
    past = compiled(past);
    REQUIRE(problem_of(FieldValue::string("2024-06-15"), past).empty());
    REQUIRE(problem_of(FieldValue::string("2024-06-16"), past) ==
            "date 2024-06-16 is after max_date today");

    FieldConfig future = of_type(FieldType::kDate);
    future.min_date = "future";
    future = compiled(future);
    REQUIRE(problem_of(FieldValue::string("2024-06-16"), future).empty());
    REQUIRE(problem_of(FieldValue::string("2024-06-15"), future) ==
            "date 2024-06-15 is before min_date future");
  }

  SECTION("today as a lower bound includes today") {
    FieldConfig config = of_type(FieldType::kDate);
    config.min_date = "today";
    config = compiled(config);
    REQUIRE(problem_of(FieldValue::string("2024-06-15"), config).empty());
    REQUIRE(problem_of(FieldValue::string("2024-06-14"), config) ==
            "date 2024-06-14 is before min_date today");
  }

  SECTION("future as an upper bound is unbounded") {
    FieldConfig config = of_type(FieldType::kDate);
    config.max_date = "future";
    config = compiled(config);
    REQUIRE(problem_of(FieldValue::string("9999-12-31"), config).empty());
    REQUIRE(problem_of(FieldValue::string("2000-01-01"), config).empty());
  }
}

TEST_CASE("Email and URL fields", "[validation][field_validator]") {
  using kira::validation::is_valid_email;
  using kira::validation::is_valid_url;

  SECTION("email shapes") {
    REQUIRE(is_valid_email("dev.team+kira@example.co"));
    REQUIRE_FALSE(is_valid_email("no-at-sign.example.com"));
    REQUIRE_FALSE(is_valid_email("user@localhost"));
    REQUIRE_FALSE(is_valid_email("user@example.c"));
    REQUIRE_FALSE(is_valid_email(" user@example.com"));
    REQUIRE(problem_of(FieldValue::string("bad"), of_type(FieldType::kEmail)) ==
            "invalid email format: bad");
  }

  SECTION("url shapes") {
    REQUIRE(is_valid_url("https://example.com/path?q=1"));
    REQUIRE(is_valid_url("http://user:pw@host:8080/x"));
    REQUIRE(is_valid_url("http://[::1]:80/"));
    REQUIRE(is_valid_url("mailto:someone@example.com"));
    REQUIRE(is_valid_url("/absolute/path"));
    REQUIRE_FALSE(is_valid_url(""));
    REQUIRE_FALSE(is_valid_url("relative/path"));
    REQUIRE_FALSE(is_valid_url("http://exa mple.com"));
    REQUIRE_FALSE(is_valid_url("http://host:port/"));
    REQUIRE_FALSE(is_valid_url("https://example.com/%zz"));
    REQUIRE_FALSE(is_valid_url("http://[zz::1]/"));
    REQUIRE_FALSE(is_valid_url(":no-scheme"));
    REQUIRE_FALSE(is_valid_url(std::string("http://example.com/\x01")));
    REQUIRE_FALSE(is_valid_url("https://example.com/" + std::string(2048, 'a')));
  }

  SECTION("allowed schemes are compared case-insensitively") {
    FieldConfig config = of_type(FieldType::kUrl);
    config.schemes = {"HTTPS"};
    config = compiled(config);
    REQUIRE(problem_of(FieldValue::string("HTTPS://example.com"), config).empty());
    REQUIRE(problem_of(FieldValue::string("http://example.com"), config) ==
            "URL scheme 'http' is not allowed. Allowed schemes: https");
  }
}

TEST_CASE("Enum fields", "[validation][field_validator]") {
  FieldConfig config = of_type(FieldType::kEnum);
  config.allowed_values = {"low", "medium", "high"};
  config = compiled(config);

  REQUIRE(problem_of(FieldValue::string("medium"), config).empty());
  REQUIRE(problem_of(FieldValue::string("High"), config) ==
          "value 'High' is not in allowed values: low, medium, high");
  REQUIRE(problem_of(FieldValue::integer(1), config) == "expected enum string, got integer");

  SECTION("case-insensitive enums") {
    config.case_sensitive = false;
    REQUIRE(problem_of(FieldValue::string("HIGH"), config).empty());
  }
}

TEST_CASE("Array fields", "[validation][field_validator]") {
  FieldConfig config = of_type(FieldType::kArray);
  config.item_type = FieldType::kEnum;
  config.allowed_values = {"api", "ui", "db"};
  config.min_length = 1;
  config.max_length = 2;
  config.unique = true;
  config = compiled(config);

  const auto list = [](std::initializer_list<const char*> items) {
    FieldValue::Sequence values;
    for (const char* item : items) {
      values.push_back(FieldValue::string(item));
    }
    return FieldValue::sequence(std::move(values));
  };

  REQUIRE(problem_of(list({"api", "ui"}), config).empty());
  REQUIRE(problem_of(list({}), config) == "array length 0 is less than min_length 1");
  REQUIRE(problem_of(list({"api", "ui", "db"}), config) ==
          "array length 3 is greater than max_length 2");
  REQUIRE(problem_of(list({"api", "web"}), config) ==
          "array item at index 1: value 'web' is not in allowed values: api, ui, db");
  REQUIRE(problem_of(list({"ui", "ui"}), config) == "array contains duplicate value: ui");

  SECTION("item kinds") {
    FieldConfig numbers = of_type(FieldType::kArray);
    numbers.item_type = FieldType::kNumber;
    numbers = compiled(numbers);
    REQUIRE(problem_of(FieldValue::sequence({FieldValue::integer(1), FieldValue::floating(2.5)}),
                       numbers)
                .empty());
    REQUIRE(problem_of(FieldValue::sequence({FieldValue::integer(1), FieldValue::string("2")}),
                       numbers) == "array item at index 1: expected number item, got string");
  }

  SECTION("uniqueness keeps kinds apart") {
    FieldConfig mixed = of_type(FieldType::kArray);
    mixed.item_type = FieldType::kString;
    mixed.unique = true;
    mixed = compiled(mixed);
    REQUIRE(problem_of(list({"a", "b"}), mixed).empty());
  }
}
