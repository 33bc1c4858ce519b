#include "kira/frontmatter/codec.h"

#include "kira/core/normalization.h"
#include "kira/frontmatter/yaml_scalar.h"
#include "kira/schema/schema.h"

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <optional>
#include <set>
#include <utility>

namespace kira::frontmatter {

namespace {

using StringResult = core::Result<std::string, core::Error>;

struct FrontMatterBounds {
  std::size_t open{0};   // index of the opening delimiter line
  std::size_t close{0};  // index of the closing delimiter line
};

// CRLF documents are split on '\n' only; the YAML parser must not see the '\r'.
void strip_carriage_return(std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

bool is_delimiter(const std::string& line) {
  return core::trim(line) == kDelimiter;
}

// Locates the delimiters. nullopt when the document has no front matter;
// close == lines.size() when the block is never closed.
std::optional<FrontMatterBounds> find_front_matter(const std::vector<std::string>& lines) {
  std::size_t first = 0;
  while (first < lines.size() && core::trim(lines[first]).empty()) {
    ++first;
  }
  if (first == lines.size() || !is_delimiter(lines[first])) {
    return std::nullopt;
  }

  FrontMatterBounds bounds{first, lines.size()};
  for (std::size_t i = first + 1; i < lines.size(); ++i) {
    if (is_delimiter(lines[i])) {
      bounds.close = i;
      break;
    }
  }
  return bounds;
}

core::Result<bool, core::Error> assign_field(domain::WorkItem& item, const std::string& key,
                                             const YAML::Node& value) {
  using R = core::Result<bool, core::Error>;

  std::string* hardcoded = nullptr;
  if (key == "id") {
    hardcoded = &item.id;
  } else if (key == "title") {
    hardcoded = &item.title;
  } else if (key == "status") {
    hardcoded = &item.status;
  } else if (key == "kind") {
    hardcoded = &item.kind;
  } else if (key == "created") {
    hardcoded = &item.created;
  }

  if (hardcoded == nullptr) {
    item.fields[key] = domain::field_value_from_yaml(value);
    return R::ok(true);
  }

  if (value.IsNull()) {
    hardcoded->clear();
    return R::ok(true);
  }
  if (!value.IsScalar()) {
    return R::err(core::parse_error("field '" + key + "' must be a scalar value"));
  }
  *hardcoded = value.Scalar();
  return R::ok(true);
}

std::string float_literal(const double value) {
  std::string text = domain::format_double(value);
  // Keep integral floats recognisable as floats when read back.
  if (text.find_first_of(".eEn") == std::string::npos) {
    text += ".0";
  }
  return text;
}

StringResult flow_mapping(const YAML::Node& node) {
  if (!node.IsDefined()) {
    return StringResult::err(core::parse_error("cannot emit an undefined value"));
  }
  YAML::Emitter out;
  out << YAML::Flow << node;
  if (!out.good()) {
    return StringResult::err(core::parse_error(out.GetLastError()));
  }
  return StringResult::ok(out.c_str());
}

// Inline (single-line) form of a value, used for scalars and sequence items.
StringResult inline_value(const domain::FieldValue& value) {
  using Kind = domain::FieldValue::Kind;
  switch (value.kind()) {
    case Kind::kNull:
      return StringResult::ok("null");
    case Kind::kString:
      return StringResult::ok(format_string_value(value.as_string()));
    case Kind::kInteger:
      return StringResult::ok(std::to_string(value.as_integer()));
    case Kind::kFloat:
      return StringResult::ok(float_literal(value.as_float()));
    case Kind::kBool:
      return StringResult::ok(value.as_bool() ? "true" : "false");
    case Kind::kSequence: {
      std::string out = "[";
      const auto& items = value.as_sequence();
      for (std::size_t i = 0; i < items.size(); ++i) {
        auto item = inline_value(items[i]);
        if (!item.has_value()) {
          return item;
        }
        if (i > 0) {
          out += ", ";
        }
        out += item.value();
      }
      out += "]";
      return StringResult::ok(std::move(out));
    }
    case Kind::kMapping:
      return flow_mapping(value.as_mapping());
  }
  return StringResult::err(core::parse_error("unsupported value kind"));
}

core::Result<bool, core::Error> write_field(std::string& out, const std::string& key,
                                            const domain::FieldValue& value) {
  using R = core::Result<bool, core::Error>;

  if (value.kind() == domain::FieldValue::Kind::kMapping) {
    const YAML::Node& node = value.as_mapping();
    if (!node.IsDefined()) {
      return R::err(core::parse_error("failed to write field '" + key +
                                      "': cannot emit an undefined value"));
    }
    YAML::Emitter emitter;
    emitter << YAML::BeginMap << YAML::Key << key << YAML::Value << node << YAML::EndMap;
    if (!emitter.good()) {
      return R::err(
          core::parse_error("failed to write field '" + key + "': " + emitter.GetLastError()));
    }
    out += emitter.c_str();
    out += "\n";
    return R::ok(true);
  }

  auto text = inline_value(value);
  if (!text.has_value()) {
    return R::err(
        core::parse_error("failed to write field '" + key + "': " + text.error().message));
  }
  out += format_scalar(key);
  out += ": ";
  out += text.value();
  out += "\n";
  return R::ok(true);
}

}  // namespace

core::Result<ParsedDocument, core::Error> parse_document(const std::string_view raw) {
  using R = core::Result<ParsedDocument, core::Error>;

  std::vector<std::string> lines = core::split_lines(raw);
  ParsedDocument doc;

  const auto bounds = find_front_matter(lines);
  if (!bounds.has_value()) {
    doc.body_lines = std::move(lines);
    return R::ok(std::move(doc));
  }
  if (bounds->close == lines.size()) {
    return R::err(core::parse_error("unterminated front matter: missing closing '---'"));
  }

  doc.has_front_matter = true;
  const auto open = lines.begin() + static_cast<std::ptrdiff_t>(bounds->open);
  const auto close = lines.begin() + static_cast<std::ptrdiff_t>(bounds->close);
  std::vector<std::string> yaml_lines(open + 1, close);
  for (auto& line : yaml_lines) {
    strip_carriage_return(line);
  }
  doc.body_lines.assign(close + 1, lines.end());

  try {
    const YAML::Node root = YAML::Load(core::join(yaml_lines, "\n"));
    if (!root.IsDefined() || root.IsNull()) {
      return R::ok(std::move(doc));
    }
    if (!root.IsMap()) {
      return R::err(core::parse_error("front matter must be a mapping"));
    }

    std::set<std::string> seen;
    for (const auto& entry : root) {
      if (!entry.first.IsScalar()) {
        return R::err(core::parse_error("front matter keys must be scalars"));
      }
      const std::string key = entry.first.Scalar();
      if (!seen.insert(key).second) {
        return R::err(core::parse_error("duplicate key '" + key + "' in front matter"));
      }
      auto assigned = assign_field(doc.item, key, entry.second);
      if (!assigned.has_value()) {
        return R::err(assigned.error());
      }
    }
  } catch (const YAML::Exception& e) {
    return R::err(core::parse_error(std::string("failed to parse front matter: ") + e.what()));
  }

  return R::ok(std::move(doc));
}

core::Result<std::string, core::Error> write_document(const domain::WorkItem& item,
                                                      const std::vector<std::string>& body_lines) {
  std::string out;
  out += kDelimiter;
  out += "\n";
  out += "id: " + format_scalar(item.id) + "\n";
  out += "title: " + format_scalar(item.title) + "\n";
  out += "status: " + format_scalar(item.status) + "\n";
  out += "kind: " + format_scalar(item.kind) + "\n";
  out += "created: " + format_scalar(item.created) + "\n";

  for (const auto& [key, value] : item.fields) {
    if (schema::is_hardcoded_field(key)) {
      continue;
    }
    auto written = write_field(out, key, value);
    if (!written.has_value()) {
      return StringResult::err(written.error());
    }
  }

  out += kDelimiter;
  out += "\n";
  out += core::join(body_lines, "\n");
  return StringResult::ok(std::move(out));
}

core::Result<std::string, core::Error> rewrite_id(const std::string_view raw,
                                                  const std::string_view new_id) {
  std::vector<std::string> lines = core::split_lines(raw);
  const auto bounds = find_front_matter(lines);
  if (!bounds.has_value() || bounds->close == lines.size()) {
    return StringResult::err(core::parse_error("document has no front matter"));
  }

  for (std::size_t i = bounds->open + 1; i < bounds->close; ++i) {
    if (lines[i].rfind("id:", 0) == 0) {
      const bool crlf = !lines[i].empty() && lines[i].back() == '\r';
      lines[i] = "id: " + format_scalar(new_id);
      if (crlf) {
        lines[i] += '\r';
      }
      return StringResult::ok(core::join(lines, "\n"));
    }
  }
  return StringResult::err(core::parse_error("front matter has no id field"));
}

}  // namespace kira::frontmatter
