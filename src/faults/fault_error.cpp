#include "faults/fault_error.hpp"

namespace chaoslab::faults {

const char* ToString(const FaultCategory category) {
  switch (category) {
  case FaultCategory::kRuntime:
    return "runtime";
  case FaultCategory::kTimeout:
    return "timeout";
  case FaultCategory::kInvalidValue:
    return "invalid_value";
  case FaultCategory::kApplication:
    return "application";
  case FaultCategory::kChaosTimeout:
    return "chaos_timeout";
  case FaultCategory::kPartialFailure:
    return "partial_failure";
  case FaultCategory::kResourceExhausted:
    return "resource_exhausted";
  case FaultCategory::kDataCorruption:
    return "data_corruption";
  }
  return "runtime";
}

std::optional<FaultCategory> ParentCategory(const FaultCategory category) {
  switch (category) {
  case FaultCategory::kRuntime:
  case FaultCategory::kTimeout:
  case FaultCategory::kInvalidValue:
    return std::nullopt;
  case FaultCategory::kApplication:
  case FaultCategory::kPartialFailure:
  case FaultCategory::kResourceExhausted:
    return FaultCategory::kRuntime;
  case FaultCategory::kChaosTimeout:
    return FaultCategory::kTimeout;
  case FaultCategory::kDataCorruption:
    return FaultCategory::kInvalidValue;
  }
  return std::nullopt;
}

bool IsA(FaultCategory category, const FaultCategory broad) {
  while (true) {
    if (category == broad) {
      return true;
    }
    const std::optional<FaultCategory> parent = ParentCategory(category);
    if (!parent.has_value()) {
      return false;
    }
    category = parent.value();
  }
}

} // namespace chaoslab::faults
