#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "core/errors/exit_codes.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <thread>

namespace fs = std::filesystem;

int main() {
  using chaoslab::core::errors::ExitCode;
  using chaoslab::tests::common::AssertContains;
  using chaoslab::tests::common::AssertExitCode;
  using chaoslab::tests::common::CreateUniqueTempDir;
  using chaoslab::tests::common::DispatchArgs;
  using chaoslab::tests::common::ReadFileToString;
  using chaoslab::tests::common::RemovePathBestEffort;
  using chaoslab::tests::common::WriteTextFile;

  const fs::path temp_root = CreateUniqueTempDir("chaoslab-run-interrupt");
  const fs::path definition_path = temp_root / "long.json";
  const fs::path result_path = temp_root / "result.json";
  // Long enough that only the interrupt can end the run inside the test.
  WriteTextFile(definition_path, R"({"name": "interrupt me", "duration_seconds": 120,
                                    "faults": [{"fault_type": "timeout", "probability": 0.5}]})");

  std::atomic<bool> run_finished{false};
  std::atomic<bool> signal_sent{false};
  std::thread interrupter([&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    if (run_finished.load()) {
      return;
    }
    signal_sent.store(true);
    std::raise(SIGINT);
  });

  const auto begin = std::chrono::steady_clock::now();
  const int exit_code = DispatchArgs({"chaoslab", "run", definition_path.string(), "--out",
                                      result_path.string(), "--log-level", "error"});
  const auto elapsed = std::chrono::steady_clock::now() - begin;
  run_finished.store(true);
  interrupter.join();

  if (!signal_sent.load()) {
    RemovePathBestEffort(temp_root);
    chaoslab::tests::common::Fail("test precondition failed: SIGINT was not sent");
  }
  AssertExitCode(exit_code, ExitCode::kExperimentAborted, "interrupted run");
  if (elapsed > std::chrono::seconds(10)) {
    RemovePathBestEffort(temp_root);
    chaoslab::tests::common::Fail("interrupted run did not stop at a tick boundary");
  }

  const std::string result_text = ReadFileToString(result_path);
  AssertContains(result_text, R"("status":"aborted")");

  RemovePathBestEffort(temp_root);
  return 0;
}
