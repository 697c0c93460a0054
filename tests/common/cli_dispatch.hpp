#ifndef CHAOSLAB_TESTS_COMMON_CLI_DISPATCH_HPP_
#define CHAOSLAB_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "assertions.hpp"
#include "chaoslab/cli/router.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace chaoslab::tests::common {

// Runs the `chaoslab` router in-process with `argv_storage` as argv.
inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return chaoslab::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

inline void ExpectExit(const std::vector<std::string>& argv_storage,
                       core::errors::ExitCode expected, std::string_view label) {
  AssertExitCode(DispatchArgs(argv_storage), expected, label);
}

} // namespace chaoslab::tests::common

#endif // CHAOSLAB_TESTS_COMMON_CLI_DISPATCH_HPP_
