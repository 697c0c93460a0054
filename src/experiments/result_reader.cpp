#include "experiments/result_reader.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

namespace chaoslab::experiments {

namespace {

using JsonValue = core::json::Value;

bool RequireMember(const JsonValue& object, std::string_view parent, std::string_view key,
                   JsonValue::Type type, const JsonValue*& out, std::string& error) {
  out = core::json::FindMember(object, key);
  const std::string path = std::string(parent) + "." + std::string(key);
  if (out == nullptr) {
    error = path + " is missing";
    return false;
  }
  if (out->type != type) {
    error = path + " must be " + core::json::TypeName(type) + ", got " +
            core::json::TypeName(out->type);
    return false;
  }
  return true;
}

bool ReadCount(const JsonValue& value, const std::string& path, std::uint64_t& out,
               std::string& error) {
  // uint64 max is not representable as a double and rounds up to 2^64, so the
  // upper bound is exclusive.
  if (value.type != JsonValue::Type::kNumber || !std::isfinite(value.number_value) ||
      value.number_value < 0.0 || std::floor(value.number_value) != value.number_value ||
      value.number_value >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
    error = path + " must be a non-negative integer";
    return false;
  }
  out = static_cast<std::uint64_t>(value.number_value);
  return true;
}

bool ReadKindCounts(const JsonValue& summary, std::string_view key,
                    std::map<std::string, std::uint64_t>& out, std::string& error) {
  const JsonValue* counts = nullptr;
  if (!RequireMember(summary, "$.summary", key, JsonValue::Type::kObject, counts, error)) {
    return false;
  }
  for (const auto& [kind, value] : counts->object_value) {
    std::uint64_t count = 0;
    if (!ReadCount(value, "$.summary." + std::string(key) + "." + kind, count, error)) {
      return false;
    }
    out[kind] = count;
  }
  return true;
}

std::string FormatCounts(const std::map<std::string, std::uint64_t>& counts) {
  if (counts.empty()) {
    return "none";
  }
  std::ostringstream out;
  bool first = true;
  for (const auto& [kind, count] : counts) {
    if (!first) {
      out << ", ";
    }
    first = false;
    out << kind << '=' << count;
  }
  return out.str();
}

std::string CountsToJson(const std::map<std::string, std::uint64_t>& counts) {
  std::ostringstream out;
  out << '{';
  bool first = true;
  for (const auto& [kind, count] : counts) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << core::QuoteJson(kind) << ':' << count;
  }
  out << '}';
  return out.str();
}

} // namespace

bool ReadResultDigest(std::string_view json_text, ResultDigest& digest, std::string& error) {
  digest = ResultDigest{};

  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "invalid result JSON: " + error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "$ must be an object";
    return false;
  }

  const JsonValue* experiment = nullptr;
  const JsonValue* field = nullptr;
  if (!RequireMember(root, "$", "experiment", JsonValue::Type::kObject, experiment, error) ||
      !RequireMember(*experiment, "$.experiment", "experiment_id", JsonValue::Type::kString,
                     field, error)) {
    return false;
  }
  digest.experiment_id = field->string_value;
  if (!RequireMember(*experiment, "$.experiment", "name", JsonValue::Type::kString, field,
                     error)) {
    return false;
  }
  digest.name = field->string_value;

  if (!RequireMember(root, "$", "status", JsonValue::Type::kString, field, error)) {
    return false;
  }
  digest.status = field->string_value;
  if (!RequireMember(root, "$", "start_time_utc", JsonValue::Type::kString, field, error)) {
    return false;
  }
  digest.start_time_utc = field->string_value;

  const JsonValue* end_time = core::json::FindMember(root, "end_time_utc");
  if (end_time != nullptr && end_time->type == JsonValue::Type::kString) {
    digest.end_time_utc = end_time->string_value;
  } else if (end_time != nullptr && end_time->type != JsonValue::Type::kNull) {
    error = "$.end_time_utc must be a string or null";
    return false;
  }

  const JsonValue* summary = nullptr;
  if (!RequireMember(root, "$", "summary", JsonValue::Type::kObject, summary, error) ||
      !RequireMember(*summary, "$.summary", "total_faults_fired", JsonValue::Type::kNumber, field,
                     error) ||
      !ReadCount(*field, "$.summary.total_faults_fired", digest.total_faults_fired, error) ||
      !ReadKindCounts(*summary, "faults_by_kind", digest.faults_by_kind, error) ||
      !ReadKindCounts(*summary, "errors_by_kind", digest.errors_by_kind, error)) {
    return false;
  }

  const JsonValue* duration = core::json::FindMember(*summary, "duration_seconds");
  if (duration != nullptr && duration->type == JsonValue::Type::kNumber) {
    digest.duration_seconds = duration->number_value;
  }
  const JsonValue* ticks = core::json::FindMember(*summary, "ticks");
  if (ticks != nullptr && !ReadCount(*ticks, "$.summary.ticks", digest.ticks, error)) {
    return false;
  }

  const JsonValue* observations = nullptr;
  if (!RequireMember(root, "$", "observations", JsonValue::Type::kArray, observations, error)) {
    return false;
  }
  digest.observation_count = observations->array_value.size();

  std::uint64_t sum = 0;
  for (const auto& [kind, count] : digest.faults_by_kind) {
    (void)kind;
    sum += count;
  }
  if (sum != digest.total_faults_fired) {
    error = "$.summary.total_faults_fired is " + std::to_string(digest.total_faults_fired) +
            " but faults_by_kind sums to " + std::to_string(sum);
    return false;
  }
  return true;
}

bool ReadResultDigestFile(const std::string& path, ResultDigest& digest, std::string& error) {
  std::ifstream file(std::filesystem::path(path), std::ios::binary);
  if (!file) {
    error = "unable to read result file: " + path;
    return false;
  }
  const std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (!ReadResultDigest(contents, digest, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

std::string RenderDigestText(const ResultDigest& digest) {
  std::ostringstream out;
  out << "Experiment : " << digest.name << " (id=" << digest.experiment_id << ")\n"
      << "Status     : " << digest.status << '\n'
      << "Start      : " << digest.start_time_utc << '\n'
      << "End        : " << digest.end_time_utc.value_or("n/a") << '\n'
      << "Summary    :\n"
      << "  total_faults_fired: " << digest.total_faults_fired << '\n'
      << "  faults_by_kind: " << FormatCounts(digest.faults_by_kind) << '\n'
      << "  errors_by_kind: " << FormatCounts(digest.errors_by_kind) << '\n'
      << "  duration_seconds: " << core::FormatJsonNumber(digest.duration_seconds) << '\n'
      << "  ticks: " << digest.ticks << '\n'
      << "Observations: " << digest.observation_count << " recorded\n";
  return out.str();
}

std::string ToJson(const ResultDigest& digest) {
  std::ostringstream out;
  out << '{' << "\"experiment_id\":" << core::QuoteJson(digest.experiment_id)
      << ",\"name\":" << core::QuoteJson(digest.name)
      << ",\"status\":" << core::QuoteJson(digest.status)
      << ",\"start_time_utc\":" << core::QuoteJson(digest.start_time_utc) << ",\"end_time_utc\":";
  if (digest.end_time_utc.has_value()) {
    out << core::QuoteJson(digest.end_time_utc.value());
  } else {
    out << "null";
  }
  out << ",\"total_faults_fired\":" << digest.total_faults_fired
      << ",\"faults_by_kind\":" << CountsToJson(digest.faults_by_kind)
      << ",\"errors_by_kind\":" << CountsToJson(digest.errors_by_kind)
      << ",\"duration_seconds\":" << core::FormatJsonNumber(digest.duration_seconds)
      << ",\"ticks\":" << digest.ticks << ",\"observation_count\":" << digest.observation_count
      << '}';
  return out.str();
}

} // namespace chaoslab::experiments
