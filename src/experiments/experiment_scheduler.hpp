#pragma once

#include "core/logging/logger.hpp"
#include "experiments/experiment_model.hpp"
#include "faults/fault_injector.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chaoslab::experiments {

// Stable classification of scheduler failures.
//
// Simulated faults never appear here: the tick loop turns them into
// observations and counters. Only caller mistakes leave the scheduler.
enum class SchedulerErrorCode {
  kNone,
  kNotFound,
  kInvalidDefinition,
  kStateConflict,
};

std::string_view ToStableErrorCode(SchedulerErrorCode code);

struct SchedulerError {
  SchedulerErrorCode code = SchedulerErrorCode::kNone;
  std::string message;
};

// Registers experiments and runs them against a one-second tick clock.
//
// All registry state (definitions, status, latest results, abort flags) lives
// in this instance behind `mu_`. Run() blocks the calling thread; concurrent
// experiments are obtained by calling Run() for different ids from different
// threads. Each run records into its own ObservationLog.
//
// Same-id policy: Run() only starts an experiment in `pending` state. A second
// Run() of an id that is running, or that already finished, fails fast with
// kStateConflict; re-running requires Schedule() again.
//
// Abort is level-triggered: the flag stays set until the id is re-scheduled,
// so an Abort() issued before Run() stops that run at its first tick.
class ExperimentScheduler {
public:
  ExperimentScheduler();
  explicit ExperimentScheduler(std::uint64_t seed);
  explicit ExperimentScheduler(std::unique_ptr<faults::IRandomSource> source);

  ExperimentScheduler(const ExperimentScheduler&) = delete;
  ExperimentScheduler& operator=(const ExperimentScheduler&) = delete;

  // Optional, not owned; must outlive every in-flight Run().
  void SetLogger(core::logging::Logger* logger);

  // Registers `definition` in `pending` state and returns its id. A non-empty
  // id is kept verbatim and replaces any previous registration of that id
  // (definition, status, abort flag and stored result are all reset).
  std::string Schedule(ExperimentDef definition);

  // Executes the experiment on the calling thread until its duration elapses
  // or an abort is observed at a tick boundary.
  //
  // Contract:
  // - true: `result` holds the finished run (completed or aborted).
  // - false: `error` is set; kNotFound and kStateConflict leave no trace,
  //   kInvalidDefinition is reported before the experiment leaves `pending`.
  bool Run(const std::string& id, RunResult& result, SchedulerError& error);

  // Sets the abort flag for `id`. Idempotent.
  bool Abort(const std::string& id, SchedulerError& error);

  std::optional<RunResult> GetResult(const std::string& id) const;
  std::optional<RunStatus> GetStatus(const std::string& id) const;

  // Registration order; re-scheduling an id keeps its original position.
  std::vector<std::string> ListExperimentIds() const;

private:
  struct Entry {
    ExperimentDef definition;
    RunStatus status = RunStatus::kPending;
    std::shared_ptr<std::atomic<bool>> abort_flag;
    std::optional<RunResult> latest_result;
    // Bumped on every Schedule() so a run that outlives a re-registration
    // does not overwrite the fresh entry.
    std::uint64_t generation = 0;
  };

  struct TickCounters;

  std::string GenerateIdLocked();
  bool RunTick(const ExperimentDef& definition, observe::ObservationLog& log,
               TickCounters& counters, core::logging::Logger* logger, std::string& error);
  void FinishRun(const std::string& id, std::uint64_t generation, const RunResult& result);

  mutable std::mutex mu_;
  std::map<std::string, Entry> entries_;
  std::vector<std::string> registration_order_;
  std::uint64_t id_seed_ = 0;
  std::uint64_t id_counter_ = 0;
  std::uint64_t next_generation_ = 1;

  faults::FaultInjector injector_;
  core::logging::Logger* logger_ = nullptr;
};

} // namespace chaoslab::experiments
