#pragma once

#include "faults/fault_model.hpp"
#include "observe/observation_log.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chaoslab::experiments {

inline constexpr std::uint32_t kDefaultDurationSeconds = 60;
inline constexpr const char* kWildcardTarget = "*";

// A named bundle of fault specs run as a unit.
//
// `id` may be left empty; the scheduler assigns one at registration and it
// never changes afterwards.
struct ExperimentDef {
  std::string id;
  std::string name;
  std::string description;
  std::vector<faults::FaultSpec> fault_specs;
  std::uint32_t duration_seconds = kDefaultDurationSeconds;
  std::vector<std::string> default_targets;
};

// Per-id lifecycle: pending -> running -> {completed | aborted}.
// completed and aborted are terminal.
enum class RunStatus {
  kPending,
  kRunning,
  kCompleted,
  kAborted,
};

const char* ToString(RunStatus status);
bool IsTerminal(RunStatus status);

// Aggregated counters for one run.
//
// A kind is counted in `faults_by_kind` whenever its probability gate fired,
// and additionally in `errors_by_kind` when that firing produced a simulated
// failure. Latency therefore only ever appears in `faults_by_kind`.
struct RunSummary {
  std::uint64_t total_faults_fired = 0;
  std::map<faults::FaultKind, std::uint64_t> faults_by_kind;
  std::map<faults::FaultKind, std::uint64_t> errors_by_kind;
  double duration_seconds = 0.0;
  std::uint64_t ticks = 0;
};

// Sum of faults_by_kind; equals total_faults_fired for every finished run.
std::uint64_t SumFaultsByKind(const RunSummary& summary);

struct RunResult {
  ExperimentDef definition;
  RunStatus status = RunStatus::kPending;
  std::chrono::system_clock::time_point start_time{};
  std::optional<std::chrono::system_clock::time_point> end_time;
  std::vector<observe::Observation> observations;
  RunSummary summary;
};

// Fault targets for one spec: its own targets, else the experiment's
// defaults, else the single wildcard target.
std::vector<std::string> ResolveTargets(const ExperimentDef& definition,
                                        const faults::FaultSpec& spec);

// JSON serializers with canonical key ordering for result files and tests.
std::string ToJson(const faults::FaultSpec& spec);
std::string ToJson(const ExperimentDef& definition);
std::string ToJson(const observe::Observation& observation);
std::string ToJson(const RunSummary& summary);
std::string ToJson(const RunResult& result);

// Multi-line operator summary printed by `chaoslab run`.
std::string RenderTextSummary(const RunResult& result);

} // namespace chaoslab::experiments
