#include "kira/domain/field_value.h"
#include "kira/frontmatter/yaml_scalar.h"

#include <catch2/catch.hpp>

#include <yaml-cpp/yaml.h>

#include <string>
#include <vector>

using kira::frontmatter::format_string_value;
using kira::frontmatter::needs_quoting;

TEST_CASE("Scalar quoting rules", "[frontmatter][yaml_scalar]") {
  SECTION("plain-safe strings stay unquoted") {
    REQUIRE_FALSE(needs_quoting("hello world"));
    REQUIRE(format_string_value("hello world") == "hello world");
  }

  SECTION("special characters, emptiness and outer whitespace force quotes") {
    for (const std::string value :
         {"", " lead", "trail ", "a: b", "# c", "[x]", "{y}", "a,b", "say \"hi\"", "it's",
          "back\\slash", "line\nbreak", "tab\there", "&anchor", "*alias", "!tag", "a|b", "a>b",
          "100%"}) {
      INFO(value);
      REQUIRE(needs_quoting(value));
    }
  }

  SECTION("escapes") {
    REQUIRE(kira::frontmatter::quote("a\"b\\c\nd\re\tf") == "\"a\\\"b\\\\c\\nd\\re\\tf\"");
  }

  SECTION("strings that would resolve to another kind are quoted") {
    REQUIRE(format_string_value("123") == "\"123\"");
    REQUIRE(format_string_value("true") == "\"true\"");
    REQUIRE(format_string_value("null") == "\"null\"");
    REQUIRE(format_string_value("1.5") == "\"1.5\"");
    REQUIRE(format_string_value("2024-01-15") == "2024-01-15");
  }

  SECTION("hardcoded scalars keep numeric-looking text plain") {
    REQUIRE(kira::frontmatter::format_scalar("001") == "001");
    REQUIRE(kira::frontmatter::format_scalar("null") == "\"null\"");
  }
}

TEST_CASE("Quoted scalars re-parse to the original string", "[frontmatter][yaml_scalar]") {
  const std::vector<std::string> samples = {
      "",          " padded ",   "key: value",    "#hash",     "a, b",  "quote\"d",
      "apos'trophe", "back\\slash", "multi\nline", "tab\tbed", "- dash", "? question",
      "@at",       "`tick`",     "42",            "false",     "~",     "plain text",
  };
  for (const auto& sample : samples) {
    INFO(sample);
    const YAML::Node node = YAML::Load("v: " + format_string_value(sample));
    const auto value = kira::domain::field_value_from_yaml(node["v"]);
    REQUIRE(value.is_string());
    REQUIRE(value.as_string() == sample);
  }
}
