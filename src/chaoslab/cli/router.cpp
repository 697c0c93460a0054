#include "chaoslab/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "experiments/definition_loader.hpp"
#include "experiments/experiment_model.hpp"
#include "experiments/experiment_scheduler.hpp"
#include "experiments/result_reader.hpp"
#include "faults/fault_injector.hpp"
#include "observe/observation_log.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace chaoslab::cli {

namespace {

constexpr std::string_view kVersion = "0.1.0";
// `inject` fills the kind-specific fields with these when the flags are
// omitted, so every kind is runnable from the command line as-is.
constexpr std::string_view kDefaultInjectTarget = "*";
constexpr std::uint64_t kDefaultInjectDurationMs = 500;
constexpr int kDefaultInjectErrorCode = 500;

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitDefinitionInvalid =
    core::errors::ToInt(core::errors::ExitCode::kDefinitionInvalid);
constexpr int kExitExperimentAborted =
    core::errors::ToInt(core::errors::ExitCode::kExperimentAborted);
constexpr int kExitFaultRaised = core::errors::ToInt(core::errors::ExitCode::kFaultRaised);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  chaoslab inject --fault <" << faults::ExpectedFaultKindList() << "> "
      << "[--probability <0..1>] [--duration <ms, default 500>] [--error-code <n, default 500>] "
         "[--message <text>] [--target <label, default *>] [--seed <n>]\n"
      << "  chaoslab run <experiment.json|yaml> [--json] [--out <result.json>] [--seed <n>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  chaoslab validate <experiment.json|yaml>\n"
      << "  chaoslab report <result.json> [--json]\n"
      << "  chaoslab version\n";
}

bool ParseUnsigned(std::string_view flag, std::string_view raw, std::uint64_t& out,
                   std::string& error) {
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected a non-negative integer)";
    return false;
  }
  return true;
}

bool ParseSigned(std::string_view flag, std::string_view raw, int& out, std::string& error) {
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  if (raw.empty() || ec != std::errc() || ptr != end) {
    error = "invalid value for " + std::string(flag) + ": '" + std::string(raw) +
            "' (expected an integer)";
    return false;
  }
  return true;
}

bool ParseProbability(std::string_view raw, double& out, std::string& error) {
  const std::string text(raw);
  char* end = nullptr;
  const double parsed = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size() || !std::isfinite(parsed) ||
      parsed < 0.0 || parsed > 1.0) {
    error = "invalid value for --probability: '" + text + "' (expected a number in [0, 1])";
    return false;
  }
  out = parsed;
  return true;
}

// Fetches the value following `args[i]` and advances `i` past it.
bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "chaoslab " << kVersion << '\n';
  return kExitSuccess;
}

void PrintIssues(const std::vector<experiments::ValidationIssue>& issues, std::string_view label) {
  for (const auto& issue : issues) {
    std::cerr << "  - " << label << issue.path << ": " << issue.message << '\n';
  }
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <experiment.json|yaml>\n";
    return kExitUsage;
  }

  const std::string path(args.front());
  experiments::ExperimentDef definition;
  experiments::ValidationReport report;
  std::string error;
  if (!experiments::LoadDefinitionFile(path, definition, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (!report.valid) {
    std::cerr << "invalid experiment: " << path << '\n';
    PrintIssues(report.issues, "");
    PrintIssues(report.warnings, "warning: ");
    return kExitDefinitionInvalid;
  }

  PrintIssues(report.warnings, "warning: ");
  std::cout << "valid: " << path << '\n';
  std::cout << "name: " << definition.name << '\n';
  std::cout << "faults: " << definition.fault_specs.size() << '\n';
  std::cout << "duration_seconds: " << definition.duration_seconds << '\n';
  return kExitSuccess;
}

struct InjectOptions {
  bool has_kind = false;
  faults::FaultSpec spec;
  std::string target = std::string(kDefaultInjectTarget);
  std::optional<std::uint64_t> seed;
};

bool ParseInjectOptions(const std::vector<std::string_view>& args, InjectOptions& options,
                        std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--fault") {
      if (!TakeValue(args, i, value, error) ||
          !faults::ParseFaultKind(value, options.spec.kind, error)) {
        return false;
      }
      options.has_kind = true;
      continue;
    }
    if (token == "--probability") {
      if (!TakeValue(args, i, value, error) ||
          !ParseProbability(value, options.spec.probability, error)) {
        return false;
      }
      continue;
    }
    if (token == "--duration") {
      std::uint64_t parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsigned(token, value, parsed, error)) {
        return false;
      }
      options.spec.duration_ms = parsed;
      continue;
    }
    if (token == "--error-code") {
      int parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseSigned(token, value, parsed, error)) {
        return false;
      }
      options.spec.error_code = parsed;
      continue;
    }
    if (token == "--message") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.spec.error_message = std::string(value);
      continue;
    }
    if (token == "--target") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (value.empty()) {
        error = "--target must not be empty";
        return false;
      }
      options.target = std::string(value);
      continue;
    }
    if (token == "--seed") {
      std::uint64_t parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsigned(token, value, parsed, error)) {
        return false;
      }
      options.seed = parsed;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    error = "inject does not accept positional arguments: " + std::string(token);
    return false;
  }

  if (!options.has_kind) {
    error = "inject requires --fault <" + faults::ExpectedFaultKindList() + ">";
    return false;
  }
  if (!options.spec.duration_ms.has_value()) {
    options.spec.duration_ms = kDefaultInjectDurationMs;
  }
  if (!options.spec.error_code.has_value()) {
    options.spec.error_code = kDefaultInjectErrorCode;
  }
  options.spec.affected_targets = {options.target};
  return true;
}

int CommandInject(const std::vector<std::string_view>& args) {
  InjectOptions options;
  std::string error;
  if (!ParseInjectOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  std::unique_ptr<faults::FaultInjector> injector =
      options.seed.has_value() ? std::make_unique<faults::FaultInjector>(options.seed.value())
                               : std::make_unique<faults::FaultInjector>();

  const std::string kind_name = faults::ToString(options.spec.kind);
  observe::ObservationLog log;
  faults::InjectionOutcome outcome;
  bool configured = false;
  {
    observe::ObservationScope scope(log, options.target, kind_name);
    configured = injector->Inject(options.spec, outcome, error);
    if (!configured) {
      scope.Fail("configuration", error);
    } else if (outcome.failure.has_value()) {
      scope.Fail(outcome.failure.value());
    }
  }

  for (const auto& observation : log.Snapshot()) {
    std::cout << experiments::ToJson(observation) << '\n';
  }

  if (!configured) {
    std::cerr << "error: invalid fault: " << error << '\n';
    return kExitDefinitionInvalid;
  }
  if (outcome.failure.has_value()) {
    const faults::FaultError& failure = outcome.failure.value();
    std::cerr << "fault raised: " << faults::ToString(failure.category) << ": " << failure.message
              << '\n';
    return kExitFaultRaised;
  }

  std::cout << (outcome.fired ? "fired: " : "not fired: ") << kind_name << '\n';
  return kExitSuccess;
}

bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--json") {
      options.json_output = true;
      continue;
    }
    if (token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.output_path = std::string(value);
      continue;
    }
    if (token == "--seed") {
      std::uint64_t parsed = 0;
      if (!TakeValue(args, i, value, error) || !ParseUnsigned(token, value, parsed, error)) {
        return false;
      }
      options.seed = parsed;
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(value, parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }

    if (!options.definition_path.empty()) {
      error = "run accepts exactly 1 experiment path";
      return false;
    }
    options.definition_path = std::string(token);
  }

  if (options.definition_path.empty()) {
    error = "run requires exactly 1 argument: <experiment.json|yaml>";
    return false;
  }
  return true;
}

volatile std::sig_atomic_t g_interrupt_requested = 0;

void HandleInterruptSignal(int /*signal*/) {
  g_interrupt_requested = 1;
}

// Turns SIGINT into a scheduler abort for the lifetime of one run.
//
// The handler only sets a flag; a watcher thread forwards it to Abort(),
// which takes the scheduler mutex and so cannot run in signal context.
class InterruptAbortGuard {
public:
  InterruptAbortGuard(experiments::ExperimentScheduler& scheduler, std::string experiment_id,
                      core::logging::Logger& logger)
      : scheduler_(scheduler), experiment_id_(std::move(experiment_id)), logger_(logger) {
    g_interrupt_requested = 0;
    previous_handler_ = std::signal(SIGINT, HandleInterruptSignal);
    watcher_ = std::thread([this]() { Watch(); });
  }

  ~InterruptAbortGuard() {
    stop_.store(true);
    watcher_.join();
    std::signal(SIGINT, previous_handler_ == SIG_ERR ? SIG_DFL : previous_handler_);
  }

  InterruptAbortGuard(const InterruptAbortGuard&) = delete;
  InterruptAbortGuard& operator=(const InterruptAbortGuard&) = delete;

private:
  void Watch() {
    while (!stop_.load()) {
      if (g_interrupt_requested != 0) {
        g_interrupt_requested = 0;
        logger_.Warn(experiment_id_, "interrupt received; aborting experiment");
        experiments::SchedulerError error;
        if (!scheduler_.Abort(experiment_id_, error)) {
          logger_.Error(experiment_id_, "abort failed",
                        {{"code", experiments::ToStableErrorCode(error.code)},
                         {"error", error.message}});
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
  }

  experiments::ExperimentScheduler& scheduler_;
  std::string experiment_id_;
  core::logging::Logger& logger_;
  std::atomic<bool> stop_{false};
  void (*previous_handler_)(int) = SIG_DFL;
  std::thread watcher_;
};

bool WriteResultFile(const std::string& output_path, const std::string& contents,
                     std::string& error) {
  const fs::path path(output_path);
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      error = "unable to create directory " + path.parent_path().string() + ": " + ec.message();
      return false;
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "unable to open result file for writing: " + output_path;
    return false;
  }
  out << contents << '\n';
  if (!out) {
    error = "failed while writing result file: " + output_path;
    return false;
  }
  return true;
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecuteExperimentRun(options);
}

bool ParseReportArgs(const std::vector<std::string_view>& args, std::string& path, bool& json,
                     std::string& error) {
  for (const std::string_view token : args) {
    if (token == "--json") {
      json = true;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!path.empty()) {
      error = "report accepts exactly 1 result path";
      return false;
    }
    path = std::string(token);
  }
  if (path.empty()) {
    error = "report requires exactly 1 argument: <result.json>";
    return false;
  }
  return true;
}

int CommandReport(const std::vector<std::string_view>& args) {
  std::string path;
  bool json = false;
  std::string error;
  if (!ParseReportArgs(args, path, json, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  experiments::ResultDigest digest;
  if (!experiments::ReadResultDigestFile(path, digest, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (json) {
    std::cout << experiments::ToJson(digest) << '\n';
  } else {
    std::cout << experiments::RenderDigestText(digest);
  }
  return kExitSuccess;
}

} // namespace

int ExecuteExperimentRun(const RunOptions& options) {
  experiments::ExperimentDef definition;
  experiments::ValidationReport report;
  std::string error;
  if (!experiments::LoadDefinitionFile(options.definition_path, definition, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    std::cerr << "invalid experiment: " << options.definition_path << '\n';
    PrintIssues(report.issues, "");
    return kExitDefinitionInvalid;
  }

  core::logging::Logger logger(options.log_level, std::cerr);
  std::unique_ptr<experiments::ExperimentScheduler> scheduler =
      options.seed.has_value()
          ? std::make_unique<experiments::ExperimentScheduler>(options.seed.value())
          : std::make_unique<experiments::ExperimentScheduler>();
  scheduler->SetLogger(&logger);

  const std::string id = scheduler->Schedule(definition);
  for (const auto& warning : report.warnings) {
    logger.Warn(id, "definition warning", {{"path", warning.path}, {"detail", warning.message}});
  }

  experiments::RunResult result;
  experiments::SchedulerError run_error;
  bool ran = false;
  {
    InterruptAbortGuard interrupt_guard(*scheduler, id, logger);
    ran = scheduler->Run(id, result, run_error);
  }

  if (!ran) {
    std::cerr << "error: " << experiments::ToStableErrorCode(run_error.code) << ": "
              << run_error.message << '\n';
    return run_error.code == experiments::SchedulerErrorCode::kInvalidDefinition
               ? kExitDefinitionInvalid
               : kExitFailure;
  }

  const std::string result_json = experiments::ToJson(result);
  if (!options.output_path.empty()) {
    if (!WriteResultFile(options.output_path, result_json, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    logger.Info(id, "result written", {{"path", options.output_path}});
  }

  if (options.json_output) {
    std::cout << result_json << '\n';
  } else {
    std::cout << experiments::RenderTextSummary(result);
    if (!options.output_path.empty()) {
      std::cout << "result_json: " << options.output_path << '\n';
    }
  }

  return result.status == experiments::RunStatus::kAborted ? kExitExperimentAborted
                                                           : kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "validate") {
    return CommandValidate(args);
  }

  if (command == "inject") {
    return CommandInject(args);
  }

  if (command == "run") {
    return CommandRun(args);
  }

  if (command == "report") {
    return CommandReport(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace chaoslab::cli
