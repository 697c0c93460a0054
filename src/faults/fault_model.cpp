#include "faults/fault_model.hpp"

#include <algorithm>
#include <cctype>

namespace chaoslab::faults {

const char* ToString(const FaultKind kind) {
  switch (kind) {
  case FaultKind::kLatency:
    return "latency";
  case FaultKind::kError:
    return "error";
  case FaultKind::kTimeout:
    return "timeout";
  case FaultKind::kPartialFailure:
    return "partial_failure";
  case FaultKind::kResourceExhaustion:
    return "resource_exhaustion";
  case FaultKind::kDataCorruption:
    return "data_corruption";
  }
  return "latency";
}

std::string ExpectedFaultKindList() {
  std::string list;
  for (const FaultKind kind : kAllFaultKinds) {
    if (!list.empty()) {
      list.push_back('|');
    }
    list += ToString(kind);
  }
  return list;
}

bool ParseFaultKind(std::string_view raw, FaultKind& kind, std::string& error) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (const FaultKind candidate : kAllFaultKinds) {
    if (normalized == ToString(candidate)) {
      kind = candidate;
      error.clear();
      return true;
    }
  }

  error = "unknown fault type '" + std::string(raw) + "' (expected " + ExpectedFaultKindList() +
          ")";
  return false;
}

bool ValidateForDispatch(const FaultSpec& spec, std::string& error) {
  switch (spec.kind) {
  case FaultKind::kLatency:
    if (!spec.duration_ms.has_value()) {
      error = "latency fault requires duration_ms";
      return false;
    }
    break;
  case FaultKind::kError:
    if (!spec.error_code.has_value()) {
      error = "error fault requires error_code";
      return false;
    }
    break;
  case FaultKind::kTimeout:
  case FaultKind::kPartialFailure:
  case FaultKind::kResourceExhaustion:
  case FaultKind::kDataCorruption:
    break;
  }

  error.clear();
  return true;
}

} // namespace chaoslab::faults
