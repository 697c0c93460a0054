#pragma once

#include "experiments/experiment_model.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace chaoslab::experiments {

struct ValidationIssue {
  std::string path;
  std::string message;
};

// `issues` make a definition unusable. `warnings` flag fields that are only
// checked when a fault is injected (latency without duration_ms, error
// without error_code): the definition loads, but the scheduler will refuse
// to run it.
struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
  std::vector<ValidationIssue> warnings;
};

enum class DefinitionFormat {
  kJson,
  kYaml,
};

const char* ToString(DefinitionFormat format);

// Picks the format from the file extension (.json, .yaml, .yml).
bool DetectDefinitionFormat(std::string_view path, DefinitionFormat& format, std::string& error);

// Parses and validates one experiment definition.
//
// Contract:
// - Returns true when validation completed (even if the definition is
//   invalid); `report` says whether `definition` is usable.
// - Syntax errors are reported as an issue under path `$`.
// - Returns false only for failures outside the validation flow.
bool ParseDefinitionText(std::string_view text, DefinitionFormat format,
                         ExperimentDef& definition, ValidationReport& report, std::string& error);

// Loads and validates a definition file.
//
// Contract:
// - Returns false if the path is unusable (missing, not a regular file,
//   unsupported extension, unreadable) and sets `error`.
// - Otherwise returns true and populates `definition` and `report`.
bool LoadDefinitionFile(const std::string& path, ExperimentDef& definition,
                        ValidationReport& report, std::string& error);

} // namespace chaoslab::experiments
