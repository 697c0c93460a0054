#pragma once

#include "core/logging/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace chaoslab::cli {

// Options shared by `chaoslab run` and in-process callers.
struct RunOptions {
  std::string definition_path;
  std::string output_path;
  bool json_output = false;
  std::optional<std::uint64_t> seed;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Loads, validates and runs one experiment definition on the calling thread.
// SIGINT during the run requests an abort. Returns a process exit code.
int ExecuteExperimentRun(const RunOptions& options);

// Routes `chaoslab` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => definition invalid
//   20 => experiment aborted
//   30 => `inject` raised a simulated failure
int Dispatch(int argc, char** argv);

} // namespace chaoslab::cli
