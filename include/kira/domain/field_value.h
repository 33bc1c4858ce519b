#pragma once

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace kira::domain {

// FieldValue is the typed value of one front-matter field.
// The kind is fixed when the YAML is parsed; validators switch on kind() and never
// inspect raw YAML. kMapping keeps the nested YAML subtree as-is so it can be
// re-emitted without loss.
class FieldValue {
 public:
  enum class Kind {
    kNull,
    kString,
    kInteger,
    kFloat,
    kBool,
    kSequence,
    kMapping,
  };

  using Sequence = std::vector<FieldValue>;

  FieldValue() = default;

  static FieldValue null() { return FieldValue{}; }
  static FieldValue string(std::string value) { return FieldValue{Storage{std::move(value)}}; }
  static FieldValue integer(std::int64_t value) { return FieldValue{Storage{value}}; }
  static FieldValue floating(double value) { return FieldValue{Storage{value}}; }
  static FieldValue boolean(bool value) { return FieldValue{Storage{value}}; }
  static FieldValue sequence(Sequence items) { return FieldValue{Storage{std::move(items)}}; }
  static FieldValue mapping(YAML::Node node) { return FieldValue{Storage{std::move(node)}}; }

  [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(data_.index()); }

  [[nodiscard]] bool is_null() const noexcept { return kind() == Kind::kNull; }
  [[nodiscard]] bool is_string() const noexcept { return kind() == Kind::kString; }
  [[nodiscard]] bool is_number() const noexcept {
    return kind() == Kind::kInteger || kind() == Kind::kFloat;
  }
  [[nodiscard]] bool is_sequence() const noexcept { return kind() == Kind::kSequence; }

  [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }
  [[nodiscard]] std::int64_t as_integer() const { return std::get<std::int64_t>(data_); }
  [[nodiscard]] double as_float() const { return std::get<double>(data_); }
  [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
  [[nodiscard]] const Sequence& as_sequence() const { return std::get<Sequence>(data_); }
  [[nodiscard]] const YAML::Node& as_mapping() const { return std::get<YAML::Node>(data_); }

  // Integer or float widened to double. Only valid when is_number().
  [[nodiscard]] double as_number() const;

  // Null, the empty string and the empty sequence count as "no value".
  [[nodiscard]] bool is_empty() const;

  // Human-readable rendering used in messages: strings unquoted, sequences as
  // "[a b c]", nulls as "<nil>".
  [[nodiscard]] std::string display_string() const;

  // Key for array uniqueness: equal for values of the same kind and value, so
  // the string "1" and the integer 1 stay distinct.
  [[nodiscard]] std::string uniqueness_key() const;

 private:
  // Alternative order must match Kind.
  using Storage =
      std::variant<std::monostate, std::string, std::int64_t, double, bool, Sequence, YAML::Node>;

  explicit FieldValue(Storage data) : data_(std::move(data)) {}

  Storage data_;
};

// Name of a kind as it appears in "expected X, got <kind>" messages.
std::string kind_name(FieldValue::Kind kind);

// field_value_from_yaml applies YAML 1.2 core-schema scalar resolution:
// quoted scalars and explicit !!str are strings; plain null/~/empty are null;
// true/false (three casings) are bools; decimal, 0x and 0o integers; decimal
// floats plus .inf/.nan; everything else is a string. Sequences recurse,
// mappings are kept as subtrees.
FieldValue field_value_from_yaml(const YAML::Node& node);

// resolve_plain_scalar resolves the text of an unquoted scalar to its kind.
FieldValue resolve_plain_scalar(const std::string& text);

// Shortest decimal form that parses back to the same double ("1.5", "3", "1e+21").
std::string format_double(double value);

}  // namespace kira::domain
