#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace chaoslab::faults {

// Failure categories produced by the injector, arranged as a shallow
// narrowing relation:
//
//   runtime        <- application, partial_failure, resource_exhausted
//   timeout        <- chaos_timeout
//   invalid_value  <- data_corruption
//
// Broad categories are never produced directly; they exist so callers can
// handle "any timeout" or "any invalid value" without enumerating kinds.
enum class FaultCategory {
  kRuntime,
  kTimeout,
  kInvalidValue,
  kApplication,
  kChaosTimeout,
  kPartialFailure,
  kResourceExhausted,
  kDataCorruption,
};

const char* ToString(FaultCategory category);

// Broad parent of `category`, or nullopt for the three roots.
std::optional<FaultCategory> ParentCategory(FaultCategory category);

// Reflexive, transitive narrowing check: IsA(kChaosTimeout, kTimeout) holds.
bool IsA(FaultCategory category, FaultCategory broad);

// Simulated failure value handed back to the code under test.
//
// `code` is set only for application errors. `message` is the full rendered
// text, e.g. "[503] upstream unavailable" or "[partial_failure] degraded".
struct FaultError {
  FaultCategory category = FaultCategory::kRuntime;
  std::optional<int> code;
  std::string message;

  bool IsA(FaultCategory broad) const {
    return faults::IsA(category, broad);
  }

  const std::string& ToString() const {
    return message;
  }
};

} // namespace chaoslab::faults
