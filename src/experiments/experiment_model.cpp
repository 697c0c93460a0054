#include "experiments/experiment_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <iomanip>
#include <sstream>

namespace chaoslab::experiments {

namespace {

using core::FormatJsonNumber;
using core::FormatUtcTimestamp;
using core::QuoteJson;

// Shortest round-trippable-enough form ("1", "0.25") for probabilities, which
// are user-authored and would read oddly with fixed decimals.
std::string FormatProbability(double probability) {
  std::ostringstream out;
  out << std::setprecision(6) << probability;
  return out.str();
}

std::string ToJsonStringArray(const std::vector<std::string>& values) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << QuoteJson(values[i]);
  }
  out << ']';
  return out.str();
}

std::string ToJsonKindCounts(const std::map<faults::FaultKind, std::uint64_t>& counts) {
  std::ostringstream out;
  out << '{';
  bool first = true;
  for (const auto& [kind, count] : counts) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << QuoteJson(faults::ToString(kind)) << ':' << count;
  }
  out << '}';
  return out.str();
}

std::string FormatKindCounts(const std::map<faults::FaultKind, std::uint64_t>& counts) {
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
    out << faults::ToString(kind) << '=' << count;
  }
  return out.str();
}

} // namespace

const char* ToString(const RunStatus status) {
  switch (status) {
  case RunStatus::kPending:
    return "pending";
  case RunStatus::kRunning:
    return "running";
  case RunStatus::kCompleted:
    return "completed";
  case RunStatus::kAborted:
    return "aborted";
  }
  return "pending";
}

bool IsTerminal(const RunStatus status) {
  return status == RunStatus::kCompleted || status == RunStatus::kAborted;
}

std::uint64_t SumFaultsByKind(const RunSummary& summary) {
  std::uint64_t total = 0;
  for (const auto& [kind, count] : summary.faults_by_kind) {
    (void)kind;
    total += count;
  }
  return total;
}

std::vector<std::string> ResolveTargets(const ExperimentDef& definition,
                                        const faults::FaultSpec& spec) {
  if (!spec.affected_targets.empty()) {
    return spec.affected_targets;
  }
  if (!definition.default_targets.empty()) {
    return definition.default_targets;
  }
  return {kWildcardTarget};
}

std::string ToJson(const faults::FaultSpec& spec) {
  std::ostringstream out;
  out << '{' << "\"fault_type\":" << QuoteJson(faults::ToString(spec.kind))
      << ",\"probability\":" << FormatProbability(spec.probability) << ",\"duration_ms\":";
  if (spec.duration_ms.has_value()) {
    out << spec.duration_ms.value();
  } else {
    out << "null";
  }
  out << ",\"error_code\":";
  if (spec.error_code.has_value()) {
    out << spec.error_code.value();
  } else {
    out << "null";
  }
  out << ",\"error_message\":";
  if (spec.error_message.has_value()) {
    out << QuoteJson(spec.error_message.value());
  } else {
    out << "null";
  }
  out << ",\"affected_components\":" << ToJsonStringArray(spec.affected_targets) << '}';
  return out.str();
}

std::string ToJson(const ExperimentDef& definition) {
  std::ostringstream out;
  out << '{' << "\"experiment_id\":" << QuoteJson(definition.id)
      << ",\"name\":" << QuoteJson(definition.name)
      << ",\"description\":" << QuoteJson(definition.description) << ",\"faults\":[";
  for (std::size_t i = 0; i < definition.fault_specs.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << ToJson(definition.fault_specs[i]);
  }
  out << "],\"duration_seconds\":" << definition.duration_seconds
      << ",\"target_components\":" << ToJsonStringArray(definition.default_targets) << '}';
  return out.str();
}

std::string ToJson(const observe::Observation& observation) {
  std::ostringstream out;
  out << '{' << "\"ts_utc\":" << QuoteJson(FormatUtcTimestamp(observation.timestamp))
      << ",\"target\":" << QuoteJson(observation.target)
      << ",\"event\":" << QuoteJson(observation.event) << ",\"details\":{";
  bool first = true;
  for (const auto& [key, value] : observation.details) {
    if (!first) {
      out << ',';
    }
    first = false;
    out << QuoteJson(key) << ':' << QuoteJson(value);
  }
  out << "}}";
  return out.str();
}

std::string ToJson(const RunSummary& summary) {
  std::ostringstream out;
  out << '{' << "\"total_faults_fired\":" << summary.total_faults_fired
      << ",\"faults_by_kind\":" << ToJsonKindCounts(summary.faults_by_kind)
      << ",\"errors_by_kind\":" << ToJsonKindCounts(summary.errors_by_kind)
      << ",\"duration_seconds\":" << FormatJsonNumber(summary.duration_seconds)
      << ",\"ticks\":" << summary.ticks << '}';
  return out.str();
}

std::string ToJson(const RunResult& result) {
  std::ostringstream out;
  out << '{' << "\"experiment\":" << ToJson(result.definition)
      << ",\"status\":" << QuoteJson(ToString(result.status))
      << ",\"start_time_utc\":" << QuoteJson(FormatUtcTimestamp(result.start_time))
      << ",\"end_time_utc\":";
  if (result.end_time.has_value()) {
    out << QuoteJson(FormatUtcTimestamp(result.end_time.value()));
  } else {
    out << "null";
  }
  out << ",\"summary\":" << ToJson(result.summary) << ",\"observations\":[";
  for (std::size_t i = 0; i < result.observations.size(); ++i) {
    if (i != 0U) {
      out << ',';
    }
    out << ToJson(result.observations[i]);
  }
  out << "]}";
  return out.str();
}

std::string RenderTextSummary(const RunResult& result) {
  std::ostringstream out;
  out << "Experiment : " << result.definition.name << " (id=" << result.definition.id << ")\n"
      << "Status     : " << ToString(result.status) << '\n'
      << "Start      : " << FormatUtcTimestamp(result.start_time) << '\n'
      << "End        : "
      << (result.end_time.has_value() ? FormatUtcTimestamp(result.end_time.value()) : "n/a")
      << '\n'
      << "Summary    :\n"
      << "  total_faults_fired: " << result.summary.total_faults_fired << '\n'
      << "  faults_by_kind: " << FormatKindCounts(result.summary.faults_by_kind) << '\n'
      << "  errors_by_kind: " << FormatKindCounts(result.summary.errors_by_kind) << '\n'
      << "  duration_seconds: " << FormatJsonNumber(result.summary.duration_seconds) << '\n'
      << "  ticks: " << result.summary.ticks << '\n'
      << "Observations: " << result.observations.size() << " recorded\n";
  return out.str();
}

} // namespace chaoslab::experiments
