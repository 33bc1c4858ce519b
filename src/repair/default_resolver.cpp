#include "kira/repair/default_resolver.h"

#include "kira/core/normalization.h"
#include "kira/validation/field_validator.h"

#include <charconv>
#include <utility>

namespace kira::repair {

namespace {

using domain::FieldValue;
using ValueResult = core::Result<FieldValue, core::Error>;

std::string got(const FieldValue& value) {
  return "got " + domain::kind_name(value.kind());
}

ValueResult resolve_date(const FieldValue& value, const schema::FieldConfig& config,
                         const core::IClock& clock) {
  if (!value.is_string()) {
    return ValueResult::err(
        core::configuration_error("date default must be a string, " + got(value)));
  }
  const std::string& text = value.as_string();
  if (text == kTodayDefault) {
    return ValueResult::ok(FieldValue::string(config.date_format.format(clock.today())));
  }
  if (!config.date_format.parse(text).has_value()) {
    return ValueResult::err(core::configuration_error(
        "invalid date default value '" + text + "': does not match format " +
        config.date_format.pattern()));
  }
  return ValueResult::ok(value);
}

ValueResult resolve_email(const FieldValue& value) {
  if (!value.is_string()) {
    return ValueResult::err(
        core::configuration_error("email default must be a string, " + got(value)));
  }
  const std::string& text = value.as_string();
  if (!text.empty() && !validation::is_valid_email(text)) {
    return ValueResult::err(core::configuration_error("invalid email default value: " + text));
  }
  return ValueResult::ok(value);
}

ValueResult resolve_url(const FieldValue& value) {
  if (!value.is_string()) {
    return ValueResult::err(
        core::configuration_error("URL default must be a string, " + got(value)));
  }
  const std::string& text = value.as_string();
  if (!text.empty() && !validation::is_valid_url(text)) {
    return ValueResult::err(core::configuration_error("invalid URL default value: " + text));
  }
  return ValueResult::ok(value);
}

ValueResult resolve_number(const FieldValue& value) {
  if (value.is_number()) {
    return ValueResult::ok(value);
  }
  if (value.is_string()) {
    std::string_view text = value.as_string();
    if (!text.empty() && text.front() == '+') {
      text.remove_prefix(1);
    }
    double number = 0.0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
    if (!text.empty() && ec == std::errc{} && end == text.data() + text.size()) {
      return ValueResult::ok(FieldValue::floating(number));
    }
  }
  return ValueResult::err(
      core::configuration_error("number default must be numeric, " + got(value)));
}

ValueResult resolve_enum(const FieldValue& value, const schema::FieldConfig& config) {
  if (!value.is_string()) {
    return ValueResult::err(
        core::configuration_error("enum default must be a string, " + got(value)));
  }
  if (!config.allowed_values.empty() &&
      !validation::is_allowed_value(value.as_string(), config)) {
    return ValueResult::err(core::configuration_error(
        "enum default '" + value.as_string() +
        "' is not in allowed values: " + core::join(config.allowed_values, ", ")));
  }
  return ValueResult::ok(value);
}

}  // namespace

ValueResult resolve_default(const schema::FieldConfig& config, const core::IClock& clock) {
  if (!config.default_value.has_value()) {
    return ValueResult::err(core::configuration_error("field has no default value"));
  }
  const FieldValue& value = *config.default_value;

  switch (config.type) {
    case schema::FieldType::kString:
      if (value.is_string()) {
        return ValueResult::ok(value);
      }
      return ValueResult::ok(FieldValue::string(value.display_string()));
    case schema::FieldType::kDate:
      return resolve_date(value, config, clock);
    case schema::FieldType::kEmail:
      return resolve_email(value);
    case schema::FieldType::kUrl:
      return resolve_url(value);
    case schema::FieldType::kNumber:
      return resolve_number(value);
    case schema::FieldType::kArray:
      if (value.is_sequence()) {
        return ValueResult::ok(value);
      }
      return ValueResult::ok(FieldValue::sequence({value}));
    case schema::FieldType::kEnum:
      return resolve_enum(value, config);
  }
  return ValueResult::ok(value);
}

core::Result<std::vector<std::string>, core::Error> apply_field_defaults(
    domain::WorkItem& item, const schema::Schema& schema, const core::IClock& clock) {
  using R = core::Result<std::vector<std::string>, core::Error>;

  std::vector<std::string> added;
  for (const auto& [name, config] : schema.fields) {
    if (schema::is_hardcoded_field(name) || !config.default_value.has_value()) {
      continue;
    }
    const auto existing = item.fields.find(name);
    if (existing != item.fields.end() && !existing->second.is_empty()) {
      continue;
    }

    auto resolved = resolve_default(config, clock);
    if (!resolved.has_value()) {
      return R::err(core::configuration_error("failed to resolve default value for field '" +
                                               name + "': " + resolved.error().message));
    }
    item.fields[name] = std::move(resolved.value());
    added.push_back(name);
  }
  return R::ok(std::move(added));
}

core::Result<bool, core::Error> verify_defaults(const schema::Schema& schema,
                                                const core::IClock& clock) {
  using R = core::Result<bool, core::Error>;

  for (const auto& [name, config] : schema.fields) {
    if (!config.default_value.has_value()) {
      continue;
    }
    auto resolved = resolve_default(config, clock);
    if (!resolved.has_value()) {
      return R::err(core::configuration_error("field '" + name +
                                              "': invalid default: " + resolved.error().message));
    }
  }
  return R::ok(true);
}

}  // namespace kira::repair
