#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chaoslab::faults {

// Closed set of simulated misbehaviours. Every switch over this enum is
// written without a default branch so a new kind fails to compile (with
// -Wswitch) until each dispatch site handles it.
enum class FaultKind {
  kLatency,
  kError,
  kTimeout,
  kPartialFailure,
  kResourceExhaustion,
  kDataCorruption,
};

inline constexpr std::array<FaultKind, 6> kAllFaultKinds = {
    FaultKind::kLatency,        FaultKind::kError,
    FaultKind::kTimeout,        FaultKind::kPartialFailure,
    FaultKind::kResourceExhaustion,
    FaultKind::kDataCorruption,
};

// Stable lowercase form used in observations, summaries and definition files.
const char* ToString(FaultKind kind);

// Case-insensitive inverse of ToString.
bool ParseFaultKind(std::string_view raw, FaultKind& kind, std::string& error);

// "latency|error|timeout|..." for usage and validation messages.
std::string ExpectedFaultKindList();

// Declarative description of one fault.
//
// Kind-specific fields are optional on purpose: `latency` needs
// `duration_ms` and `error` needs `error_code`, but that is checked only
// when the spec is injected, so a spec can be built incomplete and fail
// on first use.
struct FaultSpec {
  FaultKind kind = FaultKind::kLatency;
  double probability = 1.0;
  std::optional<std::uint64_t> duration_ms;
  std::optional<int> error_code;
  std::optional<std::string> error_message;
  std::vector<std::string> affected_targets;
};

// Dispatch-time check for kind-specific required fields.
//
// Contract:
// - true: spec is usable for its kind.
// - false: `error` names the missing field.
bool ValidateForDispatch(const FaultSpec& spec, std::string& error);

} // namespace chaoslab::faults
