#pragma once

namespace chaoslab::core::errors {

// Stable process-exit contract for the `chaoslab` command surface.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values let wrappers tell a rejected definition, an aborted
// experiment and a fault that fired during `inject` apart without scraping
// stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kDefinitionInvalid = 10,
  kExperimentAborted = 20,
  kFaultRaised = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace chaoslab::core::errors
