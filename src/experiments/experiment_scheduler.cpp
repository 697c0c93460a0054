#include "experiments/experiment_scheduler.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <thread>
#include <utility>

namespace chaoslab::experiments {

namespace {

constexpr std::uint64_t kSplitMixIncrement = 0x9e3779b97f4a7c15ULL;
constexpr const char* kSchedulerTarget = "scheduler";

std::uint64_t SplitMix64(std::uint64_t value) {
  std::uint64_t state = value + kSplitMixIncrement;
  state = (state ^ (state >> 30)) * 0xbf58476d1ce4e5b9ULL;
  state = (state ^ (state >> 27)) * 0x94d049bb133111ebULL;
  return state ^ (state >> 31);
}

std::uint64_t RandomDeviceSeed() {
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32U) ^ static_cast<std::uint64_t>(device());
}

std::string FormatProbability(double probability) {
  std::ostringstream out;
  out << std::setprecision(6) << probability;
  return out.str();
}

std::string FormatSeconds(double seconds) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << seconds;
  return out.str();
}

// Definitions built in code skip the loader, so the run re-checks the
// invariants the loader would have enforced.
bool ValidateForRun(const ExperimentDef& definition, std::string& error) {
  if (definition.duration_seconds == 0U) {
    error = "duration_seconds must be positive";
    return false;
  }
  for (std::size_t i = 0; i < definition.fault_specs.size(); ++i) {
    const faults::FaultSpec& spec = definition.fault_specs[i];
    const std::string label = "fault #" + std::to_string(i) + ": ";
    // Written as a negated range test so NaN is rejected too.
    if (!(spec.probability >= 0.0 && spec.probability <= 1.0)) {
      error = label + "probability must be within [0, 1], got " +
              FormatProbability(spec.probability);
      return false;
    }
    std::string spec_error;
    if (!faults::ValidateForDispatch(spec, spec_error)) {
      error = label + spec_error;
      return false;
    }
  }
  error.clear();
  return true;
}

} // namespace

struct ExperimentScheduler::TickCounters {
  std::map<faults::FaultKind, std::uint64_t> faults_by_kind;
  std::map<faults::FaultKind, std::uint64_t> errors_by_kind;
};

std::string_view ToStableErrorCode(const SchedulerErrorCode code) {
  switch (code) {
  case SchedulerErrorCode::kNone:
    return "none";
  case SchedulerErrorCode::kNotFound:
    return "not_found";
  case SchedulerErrorCode::kInvalidDefinition:
    return "invalid_definition";
  case SchedulerErrorCode::kStateConflict:
    return "state_conflict";
  }
  return "none";
}

ExperimentScheduler::ExperimentScheduler() : id_seed_(RandomDeviceSeed()) {}

ExperimentScheduler::ExperimentScheduler(const std::uint64_t seed)
    : id_seed_(SplitMix64(seed)), injector_(seed) {}

ExperimentScheduler::ExperimentScheduler(std::unique_ptr<faults::IRandomSource> source)
    : id_seed_(RandomDeviceSeed()), injector_(std::move(source)) {}

void ExperimentScheduler::SetLogger(core::logging::Logger* logger) {
  std::lock_guard<std::mutex> lock(mu_);
  logger_ = logger;
}

std::string ExperimentScheduler::GenerateIdLocked() {
  while (true) {
    const std::uint64_t mixed = SplitMix64(id_seed_ ^ (++id_counter_ * kSplitMixIncrement));
    std::ostringstream out;
    out << "exp-" << std::hex << std::setw(16) << std::setfill('0') << mixed;
    std::string id = out.str();
    if (entries_.find(id) == entries_.end()) {
      return id;
    }
  }
}

std::string ExperimentScheduler::Schedule(ExperimentDef definition) {
  std::lock_guard<std::mutex> lock(mu_);
  if (definition.id.empty()) {
    definition.id = GenerateIdLocked();
  }
  const std::string id = definition.id;

  auto it = entries_.find(id);
  if (it == entries_.end()) {
    registration_order_.push_back(id);
    it = entries_.emplace(id, Entry{}).first;
  }

  Entry& entry = it->second;
  entry.definition = std::move(definition);
  entry.status = RunStatus::kPending;
  entry.abort_flag = std::make_shared<std::atomic<bool>>(false);
  entry.latest_result.reset();
  entry.generation = next_generation_++;

  if (logger_ != nullptr) {
    logger_->Debug(id, "experiment scheduled",
                   {{"name", entry.definition.name},
                    {"duration_seconds", std::to_string(entry.definition.duration_seconds)},
                    {"fault_specs", std::to_string(entry.definition.fault_specs.size())}});
  }
  return id;
}

bool ExperimentScheduler::Run(const std::string& id, RunResult& result, SchedulerError& error) {
  error = SchedulerError{};

  ExperimentDef definition;
  std::shared_ptr<std::atomic<bool>> abort_flag;
  std::uint64_t generation = 0;
  core::logging::Logger* logger = nullptr;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
      error = {SchedulerErrorCode::kNotFound, "experiment not found: " + id};
      return false;
    }

    Entry& entry = it->second;
    if (entry.status == RunStatus::kRunning) {
      error = {SchedulerErrorCode::kStateConflict, "experiment '" + id + "' is already running"};
      return false;
    }
    if (IsTerminal(entry.status)) {
      error = {SchedulerErrorCode::kStateConflict,
               "experiment '" + id + "' already finished with status " +
                   ToString(entry.status) + "; schedule it again to rerun"};
      return false;
    }

    // Fail on a misconfigured definition before anything runs, rather than
    // on the first tick whose gate happens to reach the bad spec.
    std::string definition_error;
    if (!ValidateForRun(entry.definition, definition_error)) {
      error = {SchedulerErrorCode::kInvalidDefinition,
               "experiment '" + id + "' " + definition_error};
      return false;
    }

    entry.status = RunStatus::kRunning;
    definition = entry.definition;
    abort_flag = entry.abort_flag;
    generation = entry.generation;
    logger = logger_;
  }

  observe::ObservationLog log;
  TickCounters counters;
  RunResult run;
  run.definition = definition;
  run.status = RunStatus::kRunning;
  run.start_time = std::chrono::system_clock::now();

  if (logger != nullptr) {
    logger->Info(id, "experiment started",
                 {{"name", definition.name},
                  {"duration_seconds", std::to_string(definition.duration_seconds)}});
  }
  log.Record(kSchedulerTarget, "experiment_started",
             {{"experiment_id", id}, {"name", definition.name}});

  const auto loop_start = std::chrono::steady_clock::now();
  const auto deadline = loop_start + std::chrono::seconds(definition.duration_seconds);
  bool aborted = false;
  std::string tick_error;

  while (std::chrono::steady_clock::now() < deadline) {
    if (abort_flag->load()) {
      aborted = true;
      break;
    }

    ++run.summary.ticks;
    if (!RunTick(definition, log, counters, logger, tick_error)) {
      aborted = true;
      break;
    }

    // Sleep to the next whole second since loop start. Boundaries already
    // behind us (a tick slowed by latency faults) are skipped, not replayed.
    const auto elapsed = std::chrono::steady_clock::now() - loop_start;
    const auto next_boundary =
        loop_start +
        std::chrono::seconds(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count() + 1);
    std::this_thread::sleep_until(std::min(next_boundary, deadline));
  }

  // An abort raised during the final sleep lands after the last flag check
  // inside the loop; it still decides the outcome.
  if (!aborted && abort_flag->load()) {
    aborted = true;
  }

  const auto loop_end = std::chrono::steady_clock::now();
  run.end_time = std::chrono::system_clock::now();
  run.status = aborted ? RunStatus::kAborted : RunStatus::kCompleted;

  log.Record(kSchedulerTarget, "experiment_ended", {{"status", ToString(run.status)}});

  run.summary.faults_by_kind = std::move(counters.faults_by_kind);
  run.summary.errors_by_kind = std::move(counters.errors_by_kind);
  run.summary.total_faults_fired = SumFaultsByKind(run.summary);
  run.summary.duration_seconds = core::SecondsBetween(loop_start, loop_end);
  run.observations = log.Snapshot();

  FinishRun(id, generation, run);

  if (logger != nullptr) {
    logger->Info(id, "experiment finished",
                 {{"status", ToString(run.status)},
                  {"ticks", std::to_string(run.summary.ticks)},
                  {"total_faults_fired", std::to_string(run.summary.total_faults_fired)},
                  {"duration_seconds", FormatSeconds(run.summary.duration_seconds)}});
  }

  if (!tick_error.empty()) {
    error = {SchedulerErrorCode::kInvalidDefinition, "experiment '" + id + "': " + tick_error};
    return false;
  }

  result = std::move(run);
  return true;
}

bool ExperimentScheduler::RunTick(const ExperimentDef& definition, observe::ObservationLog& log,
                                  TickCounters& counters, core::logging::Logger* logger,
                                  std::string& error) {
  for (const faults::FaultSpec& spec : definition.fault_specs) {
    const std::string kind_name = faults::ToString(spec.kind);
    for (const std::string& target : ResolveTargets(definition, spec)) {
      faults::InjectionOutcome outcome;
      if (!injector_.Inject(spec, outcome, error)) {
        return false;
      }
      if (!outcome.fired) {
        continue;
      }

      ++counters.faults_by_kind[spec.kind];
      if (outcome.failure.has_value()) {
        const faults::FaultError& failure = outcome.failure.value();
        ++counters.errors_by_kind[spec.kind];
        log.Record(target, kind_name + "_exception",
                   {{"fault_kind", kind_name},
                    {"category", faults::ToString(failure.category)},
                    {"message", failure.message}});
        if (logger != nullptr) {
          logger->Debug(definition.id, "fault raised",
                        {{"target", target},
                         {"fault_kind", kind_name},
                         {"category", faults::ToString(failure.category)}});
        }
        continue;
      }

      log.Record(target, kind_name + "_injected",
                 {{"probability", FormatProbability(spec.probability)}});
    }
  }
  return true;
}

void ExperimentScheduler::FinishRun(const std::string& id, const std::uint64_t generation,
                                    const RunResult& result) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = entries_.find(id);
  if (it == entries_.end() || it->second.generation != generation) {
    // Re-scheduled while running: the new registration owns the id now.
    if (logger_ != nullptr) {
      logger_->Warn(id, "experiment was re-scheduled during its run; result not stored");
    }
    return;
  }
  it->second.status = result.status;
  it->second.latest_result = result;
}

bool ExperimentScheduler::Abort(const std::string& id, SchedulerError& error) {
  error = SchedulerError{};
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = entries_.find(id);
  if (it == entries_.end()) {
    error = {SchedulerErrorCode::kNotFound, "experiment not found: " + id};
    return false;
  }

  const bool already_set = it->second.abort_flag->exchange(true);
  if (logger_ != nullptr && !already_set) {
    logger_->Info(id, "abort requested", {{"status", ToString(it->second.status)}});
  }
  return true;
}

std::optional<RunResult> ExperimentScheduler::GetResult(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.latest_result;
}

std::optional<RunStatus> ExperimentScheduler::GetStatus(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = entries_.find(id);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.status;
}

std::vector<std::string> ExperimentScheduler::ListExperimentIds() const {
  std::lock_guard<std::mutex> lock(mu_);
  return registration_order_;
}

} // namespace chaoslab::experiments
