#include "experiments/definition_loader.hpp"

#include "core/json_dom.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace chaoslab::experiments {

namespace {

using JsonValue = core::json::Value;

constexpr std::size_t kMaxYamlDepth = 64;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

void AddWarning(ValidationReport& report, std::string path, std::string message) {
  report.warnings.push_back({.path = std::move(path), .message = std::move(message)});
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool TryGetNonNegativeInteger(const JsonValue& value, std::uint64_t& out) {
  if (value.type != JsonValue::Type::kNumber) {
    return false;
  }
  if (!std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value) {
    return false;
  }
  if (floored >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

bool TryGetInt(const JsonValue& value, int& out) {
  if (value.type != JsonValue::Type::kNumber || !std::isfinite(value.number_value)) {
    return false;
  }
  if (std::floor(value.number_value) != value.number_value) {
    return false;
  }
  if (value.number_value < static_cast<double>(std::numeric_limits<int>::min()) ||
      value.number_value > static_cast<double>(std::numeric_limits<int>::max())) {
    return false;
  }
  out = static_cast<int>(value.number_value);
  return true;
}

// Looks up `key` or its `alias`. Both spellings at once is an issue because
// the intended value is ambiguous. `path` is set to the spelling found.
const JsonValue* GetAliasedField(const JsonValue& object, const std::string& parent_path,
                                 std::string_view key, std::string_view alias, std::string& path,
                                 ValidationReport& report) {
  const JsonValue* primary = core::json::FindMember(object, key);
  const JsonValue* secondary = core::json::FindMember(object, alias);
  if (primary != nullptr && secondary != nullptr) {
    AddIssue(report, parent_path + "." + std::string(alias),
             "duplicates " + parent_path + "." + std::string(key) + "; use only one of them");
  }
  if (primary != nullptr) {
    path = parent_path + "." + std::string(key);
    return primary;
  }
  path = parent_path + "." + std::string(alias);
  return secondary;
}

bool IsNull(const JsonValue* value) {
  return value == nullptr || value->type == JsonValue::Type::kNull;
}

void ParseStringList(const JsonValue* field, const std::string& path,
                     std::vector<std::string>& out, ValidationReport& report) {
  out.clear();
  if (IsNull(field)) {
    return;
  }
  if (field->type != JsonValue::Type::kArray) {
    AddIssue(report, path, "must be an array of strings");
    return;
  }
  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& entry = field->array_value[i];
    const std::string entry_path = path + "[" + std::to_string(i) + "]";
    if (entry.type != JsonValue::Type::kString) {
      AddIssue(report, entry_path,
               std::string("must be a string, got ") + core::json::TypeName(entry.type));
      continue;
    }
    if (entry.string_value.empty()) {
      AddIssue(report, entry_path, "must not be empty");
      continue;
    }
    out.push_back(entry.string_value);
  }
}

void ParseFaultSpec(const JsonValue& node, const std::string& path, faults::FaultSpec& spec,
                    ValidationReport& report) {
  if (node.type != JsonValue::Type::kObject) {
    AddIssue(report, path, std::string("must be an object, got ") + core::json::TypeName(node.type));
    return;
  }

  std::string field_path;
  const JsonValue* kind = GetAliasedField(node, path, "fault_type", "kind", field_path, report);
  bool kind_known = false;
  if (kind == nullptr) {
    AddIssue(report, path + ".fault_type",
             "is required; expected one of " + faults::ExpectedFaultKindList());
  } else if (kind->type != JsonValue::Type::kString) {
    AddIssue(report, field_path, "must be a string");
  } else {
    std::string kind_error;
    if (faults::ParseFaultKind(kind->string_value, spec.kind, kind_error)) {
      kind_known = true;
    } else {
      AddIssue(report, field_path, kind_error);
    }
  }

  if (const JsonValue* probability = core::json::FindMember(node, "probability");
      !IsNull(probability)) {
    if (probability->type != JsonValue::Type::kNumber ||
        !std::isfinite(probability->number_value)) {
      AddIssue(report, path + ".probability", "must be a number in [0, 1]");
    } else if (probability->number_value < 0.0 || probability->number_value > 1.0) {
      AddIssue(report, path + ".probability", "must be within [0, 1]");
    } else {
      spec.probability = probability->number_value;
    }
  }

  const JsonValue* duration =
      GetAliasedField(node, path, "duration_ms", "duration", field_path, report);
  if (!IsNull(duration)) {
    std::uint64_t parsed = 0;
    if (TryGetNonNegativeInteger(*duration, parsed)) {
      spec.duration_ms = parsed;
    } else {
      AddIssue(report, field_path, "must be a non-negative integer (milliseconds)");
    }
  }

  if (const JsonValue* code = core::json::FindMember(node, "error_code"); !IsNull(code)) {
    int parsed = 0;
    if (TryGetInt(*code, parsed)) {
      spec.error_code = parsed;
    } else {
      AddIssue(report, path + ".error_code", "must be an integer");
    }
  }

  if (const JsonValue* message = core::json::FindMember(node, "error_message");
      !IsNull(message)) {
    if (message->type == JsonValue::Type::kString) {
      spec.error_message = message->string_value;
    } else {
      AddIssue(report, path + ".error_message", "must be a string");
    }
  }

  const JsonValue* targets = GetAliasedField(node, path, "affected_components",
                                             "affected_targets", field_path, report);
  ParseStringList(targets, field_path, spec.affected_targets, report);

  if (!kind_known) {
    return;
  }
  if (spec.kind == faults::FaultKind::kLatency && !spec.duration_ms.has_value()) {
    AddWarning(report, path + ".duration_ms",
               "latency fault has no duration_ms; it will be rejected when run");
  }
  if (spec.kind == faults::FaultKind::kError && !spec.error_code.has_value()) {
    AddWarning(report, path + ".error_code",
               "error fault has no error_code; it will be rejected when run");
  }
}

void ParseDefinitionObject(const JsonValue& root, ExperimentDef& definition,
                           ValidationReport& report) {
  if (root.type != JsonValue::Type::kObject) {
    AddIssue(report, "$",
             std::string("definition must be an object, got ") + core::json::TypeName(root.type));
    return;
  }

  std::string field_path;
  const JsonValue* id = GetAliasedField(root, "$", "experiment_id", "id", field_path, report);
  if (!IsNull(id)) {
    if (id->type != JsonValue::Type::kString) {
      AddIssue(report, field_path, "must be a string");
    } else {
      definition.id = id->string_value;
    }
  }

  const JsonValue* name = core::json::FindMember(root, "name");
  if (name == nullptr) {
    AddIssue(report, "$.name", "is required; give the experiment a human-readable name");
  } else if (name->type != JsonValue::Type::kString) {
    AddIssue(report, "$.name", "must be a string");
  } else if (name->string_value.empty()) {
    AddIssue(report, "$.name", "must not be empty");
  } else {
    definition.name = name->string_value;
  }

  if (const JsonValue* description = core::json::FindMember(root, "description");
      !IsNull(description)) {
    if (description->type != JsonValue::Type::kString) {
      AddIssue(report, "$.description", "must be a string");
    } else {
      definition.description = description->string_value;
    }
  }

  if (const JsonValue* duration = core::json::FindMember(root, "duration_seconds");
      !IsNull(duration)) {
    std::uint64_t parsed = 0;
    if (!TryGetNonNegativeInteger(*duration, parsed) || parsed == 0U) {
      AddIssue(report, "$.duration_seconds", "must be a positive integer (seconds)");
    } else if (parsed > std::numeric_limits<std::uint32_t>::max()) {
      AddIssue(report, "$.duration_seconds", "is too large");
    } else {
      definition.duration_seconds = static_cast<std::uint32_t>(parsed);
    }
  }

  const JsonValue* targets =
      GetAliasedField(root, "$", "target_components", "targets", field_path, report);
  ParseStringList(targets, field_path, definition.default_targets, report);

  const JsonValue* faults = GetAliasedField(root, "$", "faults", "fault_specs", field_path, report);
  if (IsNull(faults)) {
    return;
  }
  if (faults->type != JsonValue::Type::kArray) {
    AddIssue(report, field_path, "must be an array of fault objects");
    return;
  }
  for (std::size_t i = 0; i < faults->array_value.size(); ++i) {
    faults::FaultSpec spec;
    ParseFaultSpec(faults->array_value[i], field_path + "[" + std::to_string(i) + "]", spec,
                   report);
    definition.fault_specs.push_back(std::move(spec));
  }
}

bool IsDigits(std::string_view text, int base) {
  if (text.empty()) {
    return false;
  }
  for (const char c : text) {
    const auto u = static_cast<unsigned char>(c);
    const bool ok = base == 16 ? std::isxdigit(u) != 0
                               : (c >= '0' && c < static_cast<char>('0' + base));
    if (!ok) {
      return false;
    }
  }
  return true;
}

// [-+]? ( . [0-9]+ | [0-9]+ ( . [0-9]* )? ) ( [eE] [-+]? [0-9]+ )?
bool IsYamlDecimal(std::string_view text) {
  std::size_t pos = 0;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    ++pos;
  }
  const auto take_digits = [&text, &pos]() {
    const std::size_t begin = pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      ++pos;
    }
    return pos - begin;
  };

  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    if (take_digits() == 0U) {
      return false;
    }
  } else {
    if (take_digits() == 0U) {
      return false;
    }
    if (pos < text.size() && text[pos] == '.') {
      ++pos;
      take_digits();
    }
  }

  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
      ++pos;
    }
    if (take_digits() == 0U) {
      return false;
    }
  }
  return pos == text.size();
}

// Numbers as YAML 1.2's core schema resolves plain scalars: decimal ints and
// floats, 0x/0o ints, and the dotted .inf/.nan spellings. Anything else
// ("nan", "Infinity", "1_000") stays a string.
bool TryParseYamlCoreNumber(const std::string& raw, double& out) {
  if (IsYamlDecimal(raw)) {
    out = std::strtod(raw.c_str(), nullptr);
    return true;
  }
  const std::string_view text(raw);
  if (text.size() > 2U && text.substr(0, 2) == "0x" && IsDigits(text.substr(2), 16)) {
    out = static_cast<double>(std::strtoull(raw.c_str() + 2, nullptr, 16));
    return true;
  }
  if (text.size() > 2U && text.substr(0, 2) == "0o" && IsDigits(text.substr(2), 8)) {
    out = static_cast<double>(std::strtoull(raw.c_str() + 2, nullptr, 8));
    return true;
  }

  std::string_view unsigned_part = text;
  double sign = 1.0;
  if (!unsigned_part.empty() && (unsigned_part.front() == '-' || unsigned_part.front() == '+')) {
    sign = unsigned_part.front() == '-' ? -1.0 : 1.0;
    unsigned_part.remove_prefix(1);
  }
  if (unsigned_part == ".inf" || unsigned_part == ".Inf" || unsigned_part == ".INF") {
    out = sign * std::numeric_limits<double>::infinity();
    return true;
  }
  if (text == ".nan" || text == ".NaN" || text == ".NAN") {
    out = std::numeric_limits<double>::quiet_NaN();
    return true;
  }
  return false;
}

// Plain scalars are typed the way YAML 1.2's core schema reads them; quoted
// scalars (tag "!") always stay strings.
void ConvertYamlScalar(const YAML::Node& node, JsonValue& out) {
  const std::string& raw = node.Scalar();
  if (node.Tag() != "!") {
    double number = 0.0;
    if (TryParseYamlCoreNumber(raw, number)) {
      out.type = JsonValue::Type::kNumber;
      out.number_value = number;
      return;
    }
    if (raw == "true" || raw == "True" || raw == "TRUE" || raw == "false" || raw == "False" ||
        raw == "FALSE") {
      out.type = JsonValue::Type::kBool;
      out.bool_value = raw.front() == 't' || raw.front() == 'T';
      return;
    }
  }
  out.type = JsonValue::Type::kString;
  out.string_value = raw;
}

bool ConvertYamlNode(const YAML::Node& node, JsonValue& out, const std::string& path,
                     std::size_t depth, std::string& error) {
  if (depth > kMaxYamlDepth) {
    error = path + ": nesting deeper than " + std::to_string(kMaxYamlDepth) + " levels";
    return false;
  }

  switch (node.Type()) {
  case YAML::NodeType::Undefined:
  case YAML::NodeType::Null:
    out.type = JsonValue::Type::kNull;
    return true;
  case YAML::NodeType::Scalar:
    ConvertYamlScalar(node, out);
    return true;
  case YAML::NodeType::Sequence:
    out.type = JsonValue::Type::kArray;
    for (std::size_t i = 0; i < node.size(); ++i) {
      JsonValue element;
      if (!ConvertYamlNode(node[i], element, path + "[" + std::to_string(i) + "]", depth + 1U,
                           error)) {
        return false;
      }
      out.array_value.push_back(std::move(element));
    }
    return true;
  case YAML::NodeType::Map:
    out.type = JsonValue::Type::kObject;
    for (const auto& kv : node) {
      if (!kv.first.IsScalar()) {
        error = path + ": mapping keys must be scalars";
        return false;
      }
      const std::string key = kv.first.Scalar();
      JsonValue member;
      if (!ConvertYamlNode(kv.second, member, path + "." + key, depth + 1U, error)) {
        return false;
      }
      out.object_value[key] = std::move(member);
    }
    return true;
  }
  out.type = JsonValue::Type::kNull;
  return true;
}

bool ParseDocument(std::string_view text, DefinitionFormat format, JsonValue& root,
                   std::string& error) {
  switch (format) {
  case DefinitionFormat::kJson:
    return core::json::Parse(text, root, error);
  case DefinitionFormat::kYaml: {
    YAML::Node document;
    try {
      document = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
      error = std::string("invalid YAML: ") + e.what();
      return false;
    }
    return ConvertYamlNode(document, root, "$", 0U, error);
  }
  }
  error = "unsupported definition format";
  return false;
}

} // namespace

const char* ToString(const DefinitionFormat format) {
  switch (format) {
  case DefinitionFormat::kJson:
    return "json";
  case DefinitionFormat::kYaml:
    return "yaml";
  }
  return "json";
}

bool DetectDefinitionFormat(std::string_view path, DefinitionFormat& format, std::string& error) {
  const std::string extension = ToLower(fs::path(path).extension().string());
  if (extension == ".json") {
    format = DefinitionFormat::kJson;
    return true;
  }
  if (extension == ".yaml" || extension == ".yml") {
    format = DefinitionFormat::kYaml;
    return true;
  }
  error = "definition file must use .json, .yaml or .yml extension: " + std::string(path);
  return false;
}

bool ParseDefinitionText(std::string_view text, DefinitionFormat format,
                         ExperimentDef& definition, ValidationReport& report, std::string& error) {
  report = ValidationReport{};
  definition = ExperimentDef{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!ParseDocument(text, format, root, parse_error)) {
    AddIssue(report, "$",
             parse_error + " (fix the " + ToString(format) +
                 " syntax and rerun 'chaoslab validate <experiment>')");
    report.valid = false;
    return true;
  }

  ParseDefinitionObject(root, definition, report);
  report.valid = report.issues.empty();
  return true;
}

bool LoadDefinitionFile(const std::string& path, ExperimentDef& definition,
                        ValidationReport& report, std::string& error) {
  if (path.empty()) {
    error = "definition path cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = "definition file not found: " + path;
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "definition path must point to a regular file: " + path;
    return false;
  }

  DefinitionFormat format = DefinitionFormat::kJson;
  if (!DetectDefinitionFormat(path, format, error)) {
    return false;
  }

  std::ifstream file(fs::path(path), std::ios::binary);
  if (!file) {
    error = "unable to read definition file: " + path;
    return false;
  }
  const std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (contents.empty()) {
    report = ValidationReport{};
    definition = ExperimentDef{};
    AddIssue(report, "$", "definition file is empty; provide an experiment object");
    report.valid = false;
    return true;
  }

  return ParseDefinitionText(contents, format, definition, report, error);
}

} // namespace chaoslab::experiments
